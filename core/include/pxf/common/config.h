#pragma once
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include "pxf/common/types.h"
#include "pxf/transfer/transfer_options.h"

namespace pxf {

inline std::string getenv_or(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    return (v && *v) ? std::string(v) : def;
}

inline bool parse_bool(const std::string& v) {
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

struct Config {
    PeerId peer_id = 1;
    uint16_t port = 9000;
    // "id=host:port,id=host:port"
    std::string peers;
    std::string log_path = "./pxf.log";
    bool debug = false;
    transfer::TransferOptions transfer;

    // Throws std::invalid_argument / std::out_of_range on unparsable values.
    static Config from_env() {
        Config c;
        c.peer_id = static_cast<PeerId>(std::stoul(getenv_or("PXF_PEER_ID", "1")));
        c.port = static_cast<uint16_t>(std::stoi(getenv_or("PXF_PORT", "9000")));
        c.peers = getenv_or("PXF_PEERS", "");
        c.log_path = getenv_or("PXF_LOG_PATH", "./pxf.log");
        c.debug = parse_bool(getenv_or("PXF_DEBUG", "0"));

        auto& t = c.transfer;
        t.bytes_per_chunk = static_cast<uint32_t>(std::stoul(getenv_or("PXF_BYTES_PER_CHUNK", "10000")));
        t.chunks_per_second = std::stoi(getenv_or("PXF_CHUNKS_PER_SECOND", "10"));
        t.server_timeout_seconds = std::stod(getenv_or("PXF_SERVER_TIMEOUT", "5"));
        t.client_timeout_seconds = std::stod(getenv_or("PXF_CLIENT_TIMEOUT", "15"));
        t.ready_poll_interval_seconds = std::stod(getenv_or("PXF_READY_POLL_INTERVAL", "0.1"));
        t.reassembly_window = static_cast<uint32_t>(std::stoul(getenv_or("PXF_REASSEMBLY_WINDOW", "1024")));
        t.history_limit = static_cast<size_t>(std::stoul(getenv_or("PXF_HISTORY_LIMIT", "64")));
        t.download_dir = getenv_or("PXF_DOWNLOAD_DIR", "./downloads");
        t.remove_partial_on_failure = parse_bool(getenv_or("PXF_REMOVE_PARTIAL", "0"));

        if (t.bytes_per_chunk == 0) throw std::invalid_argument("PXF_BYTES_PER_CHUNK must be positive");
        return c;
    }
};

} // namespace pxf

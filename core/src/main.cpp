#include <boost/asio.hpp>
#include <csignal>
#include <iostream>
#include "pxf/common/config.h"
#include "pxf/log/logger.h"
#include "pxf/net/peer_directory.h"
#include "pxf/net/tcp_transport.h"
#include "pxf/transfer/transfer_engine.h"
#include "pxf/transfer/transfer_registry.h"

using pxf::transfer::DescriptorPtr;
using pxf::transfer::TransferError;

static void usage(const char* prog) {
  std::cerr << "usage:\n"
            << "  " << prog << " serve [port]\n"
            << "  " << prog << " send <target_peer_id> <path> [port]\n"
            << "environment: PXF_PEER_ID, PXF_PORT, PXF_PEERS=id=host:port,...,\n"
            << "             PXF_DOWNLOAD_DIR, PXF_BYTES_PER_CHUNK, PXF_CHUNKS_PER_SECOND, ...\n";
}

int main(int argc, char** argv) {
  if (argc < 2) {
    usage(argv[0]);
    return 2;
  }
  std::string mode = argv[1];
  if ((mode != "serve" && mode != "send") || (mode == "send" && argc < 4)) {
    usage(argv[0]);
    return 2;
  }

  pxf::Config cfg;
  pxf::net::StaticPeerDirectory peers;
  try {
    cfg = pxf::Config::from_env();
    if (mode == "serve" && argc >= 3) cfg.port = static_cast<uint16_t>(std::stoi(argv[2]));
    if (mode == "send" && argc >= 5) cfg.port = static_cast<uint16_t>(std::stoi(argv[4]));
    peers.load(cfg.peers);
  } catch (const std::exception& e) {
    std::cerr << "[config] FATAL: " << e.what() << "\n";
    return 1;
  }

  pxf::Logger::instance().init(cfg.log_path);
  pxf::Logger::instance().set_debug(cfg.debug);

  boost::asio::io_context io;
  pxf::transfer::TransferRegistry registry(cfg.transfer.history_limit);

  try {
    pxf::net::TcpTransport transport(io, cfg.peer_id, cfg.port, peers);
    pxf::transfer::TransferEngine engine(io, transport, peers, registry, cfg.transfer);
    transport.set_message_handler([&engine](const pxf::protocol::Message& msg) { engine.handle(msg); });

    int exit_code = 0;
    pxf::transfer::TransferEvents events;
    events.on_download_started = [](const DescriptorPtr& d) {
      std::cout << "[node] receiving " << d->path << " (" << d->total_bytes << " bytes) from peer "
                << d->sender_peer << "\n";
    };
    events.on_download_succeeded = [](const DescriptorPtr& d) {
      std::cout << "[node] received " << d->path << "\n";
    };
    events.on_download_failed = [](const DescriptorPtr& d, TransferError e, const std::string& reason) {
      std::cout << "[node] download " << d->path << " failed (" << pxf::transfer::to_string(e) << "): "
                << reason << "\n";
    };
    events.on_upload_succeeded = [&](const DescriptorPtr& d) {
      std::cout << "[node] sent " << d->path << " (" << d->sent_bytes.load() << " bytes)\n";
      if (mode == "send") transport.when_flushed([&io]() { io.stop(); });
    };
    events.on_upload_failed = [&](const DescriptorPtr& d, TransferError e, const std::string& reason) {
      std::cout << "[node] upload " << d->path << " failed (" << pxf::transfer::to_string(e) << "): "
                << reason << "\n";
      exit_code = 1;
      if (mode == "send") io.stop();
    };
    engine.set_events(events);

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
      if (ec) return;
      std::cout << "[node] shutting down\n";
      transport.stop();
      io.stop();
    });

    transport.start();
    std::cout << "[node] peer " << cfg.peer_id << " on port " << transport.port()
              << ", " << peers.size() << " known peers\n";

    if (mode == "send") {
      auto target = static_cast<pxf::PeerId>(std::stoul(argv[2]));
      engine.send_file(argv[3], target);
    }

    io.run();
    return exit_code;
  } catch (const std::exception& e) {
    std::cerr << "[node] FATAL: " << e.what() << "\n";
    return 1;
  }
}

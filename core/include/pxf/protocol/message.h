#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <stdexcept>
#include <arpa/inet.h>

namespace pxf::protocol {

static constexpr uint32_t MAGIC = 0x50584631; // "PXF1"
static constexpr uint8_t  VERSION = 1;
static constexpr size_t   HEADER_SIZE = 12;
static constexpr uint32_t MAX_PAYLOAD = 16 * 1024 * 1024;

enum class MsgType : uint8_t {
  // Chunked transfer protocol
  TRANSFER_SETUP = 40,
  TRANSFER_READY = 41,
  TRANSFER_CHUNK = 42
};

inline const char* to_string(MsgType t) {
  switch (t) {
    case MsgType::TRANSFER_SETUP: return "TRANSFER_SETUP";
    case MsgType::TRANSFER_READY: return "TRANSFER_READY";
    case MsgType::TRANSFER_CHUNK: return "TRANSFER_CHUNK";
  }
  return "UNKNOWN";
}

#pragma pack(push, 1)
struct MessageHeaderWire {
  uint32_t magic_be;   // network order
  uint8_t  version;
  uint8_t  type;
  uint32_t len_be;     // network order
  uint16_t reserved_be; // network order (0 for now)
};
#pragma pack(pop)

static_assert(sizeof(MessageHeaderWire) == HEADER_SIZE, "frame header must be 12 bytes");

struct Message {
  MsgType type;
  std::vector<uint8_t> payload;
};

inline MessageHeaderWire make_header(MsgType type, uint32_t len) {
  MessageHeaderWire h{};
  h.magic_be = htonl(MAGIC);
  h.version  = VERSION;
  h.type     = static_cast<uint8_t>(type);
  h.len_be   = htonl(len);
  h.reserved_be = htons(0);
  return h;
}

inline void validate_header(const MessageHeaderWire& h) {
  if (ntohl(h.magic_be) != MAGIC) throw std::runtime_error("bad magic");
  if (h.version != VERSION) throw std::runtime_error("bad version");
  if (ntohl(h.len_be) > MAX_PAYLOAD) throw std::runtime_error("payload too large");
}

inline uint32_t payload_len(const MessageHeaderWire& h) {
  return ntohl(h.len_be);
}

} // namespace pxf::protocol

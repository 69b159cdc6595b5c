#pragma once

#include <cstdint>
#include <cstring>
#include <vector>
#include <string>
#include <stdexcept>
#include <arpa/inet.h>
#include "pxf/common/types.h"
#include "pxf/protocol/message.h"

namespace pxf::protocol {

namespace wire {

inline void put_u16(std::vector<uint8_t>& out, uint16_t v) {
  uint16_t be = htons(v);
  out.insert(out.end(), reinterpret_cast<const uint8_t*>(&be),
             reinterpret_cast<const uint8_t*>(&be) + 2);
}

inline void put_u32(std::vector<uint8_t>& out, uint32_t v) {
  uint32_t be = htonl(v);
  out.insert(out.end(), reinterpret_cast<const uint8_t*>(&be),
             reinterpret_cast<const uint8_t*>(&be) + 4);
}

inline void put_u64(std::vector<uint8_t>& out, uint64_t v) {
  put_u32(out, static_cast<uint32_t>(v >> 32));
  put_u32(out, static_cast<uint32_t>(v & 0xFFFFFFFFULL));
}

inline uint16_t get_u16(const std::vector<uint8_t>& in, size_t pos) {
  uint16_t be;
  std::memcpy(&be, in.data() + pos, 2);
  return ntohs(be);
}

inline uint32_t get_u32(const std::vector<uint8_t>& in, size_t pos) {
  uint32_t be;
  std::memcpy(&be, in.data() + pos, 4);
  return ntohl(be);
}

inline uint64_t get_u64(const std::vector<uint8_t>& in, size_t pos) {
  return (static_cast<uint64_t>(get_u32(in, pos)) << 32) | get_u32(in, pos + 4);
}

} // namespace wire

// TRANSFER_SETUP payload format:
// u16 path_len (network order)
// bytes path
// u32 sender_peer (network order)
// u64 total_bytes (network order)
// u32 bytes_per_chunk (network order)
// u16 transfer_id (network order)

struct SetupMsg {
  std::string path;
  PeerId sender_peer = 0;
  uint64_t total_bytes = 0;
  uint32_t bytes_per_chunk = 0;
  TransferId transfer_id = 0;

  static SetupMsg deserialize(const std::vector<uint8_t>& payload) {
    if (payload.size() < 2) throw std::runtime_error("TRANSFER_SETUP: payload too short");

    size_t pos = 0;
    SetupMsg msg;

    uint16_t path_len = wire::get_u16(payload, pos);
    pos += 2;
    if (pos + path_len > payload.size()) throw std::runtime_error("TRANSFER_SETUP: invalid path_len");
    msg.path = std::string(reinterpret_cast<const char*>(payload.data() + pos), path_len);
    pos += path_len;

    if (pos + 18 > payload.size()) throw std::runtime_error("TRANSFER_SETUP: missing transfer fields");
    msg.sender_peer = wire::get_u32(payload, pos);
    pos += 4;
    msg.total_bytes = wire::get_u64(payload, pos);
    pos += 8;
    msg.bytes_per_chunk = wire::get_u32(payload, pos);
    pos += 4;
    msg.transfer_id = wire::get_u16(payload, pos);

    return msg;
  }

  std::vector<uint8_t> serialize() const {
    if (path.size() > 0xFFFF) throw std::runtime_error("TRANSFER_SETUP: path too long");
    std::vector<uint8_t> payload;
    payload.reserve(20 + path.size());

    wire::put_u16(payload, static_cast<uint16_t>(path.size()));
    payload.insert(payload.end(), path.begin(), path.end());
    wire::put_u32(payload, sender_peer);
    wire::put_u64(payload, total_bytes);
    wire::put_u32(payload, bytes_per_chunk);
    wire::put_u16(payload, transfer_id);

    return payload;
  }

  Message to_message() const { return Message{MsgType::TRANSFER_SETUP, serialize()}; }
};

// TRANSFER_READY payload format:
// u32 receiver_peer (network order)
// u16 transfer_id (network order)

struct ReadyMsg {
  PeerId receiver_peer = 0;
  TransferId transfer_id = 0;

  static ReadyMsg deserialize(const std::vector<uint8_t>& payload) {
    if (payload.size() < 6) throw std::runtime_error("TRANSFER_READY: payload too short");

    ReadyMsg msg;
    msg.receiver_peer = wire::get_u32(payload, 0);
    msg.transfer_id = wire::get_u16(payload, 4);
    return msg;
  }

  std::vector<uint8_t> serialize() const {
    std::vector<uint8_t> payload;
    payload.reserve(6);
    wire::put_u32(payload, receiver_peer);
    wire::put_u16(payload, transfer_id);
    return payload;
  }

  Message to_message() const { return Message{MsgType::TRANSFER_READY, serialize()}; }
};

// TRANSFER_CHUNK payload format:
// u32 sender_peer (network order)
// u16 transfer_id (network order)
// u32 step (network order)
// bytes data (rest of payload)

struct ChunkMsg {
  PeerId sender_peer = 0;
  TransferId transfer_id = 0;
  uint32_t step = 0;
  std::vector<uint8_t> data;

  static ChunkMsg deserialize(const std::vector<uint8_t>& payload) {
    if (payload.size() < 10) throw std::runtime_error("TRANSFER_CHUNK: payload too short");

    ChunkMsg msg;
    msg.sender_peer = wire::get_u32(payload, 0);
    msg.transfer_id = wire::get_u16(payload, 4);
    msg.step = wire::get_u32(payload, 6);

    if (payload.size() > 10) {
      msg.data.assign(payload.begin() + 10, payload.end());
    }

    return msg;
  }

  std::vector<uint8_t> serialize() const {
    std::vector<uint8_t> payload;
    payload.reserve(10 + data.size());

    wire::put_u32(payload, sender_peer);
    wire::put_u16(payload, transfer_id);
    wire::put_u32(payload, step);
    payload.insert(payload.end(), data.begin(), data.end());

    return payload;
  }

  Message to_message() const { return Message{MsgType::TRANSFER_CHUNK, serialize()}; }
};

} // namespace pxf::protocol

#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include "pxf/common/types.h"

namespace pxf::transfer {

enum class TransferDirection {
  UPLOAD,
  DOWNLOAD
};

enum class TransferState {
  // Sender side
  CREATED,         // Source opened, id allocated, nothing sent yet
  AWAITING_READY,  // Setup sent, waiting for the receiver's Ready
  STREAMING,       // Sending chunks
  // Receiver side
  SETUP_RECEIVED,  // Setup accepted, descriptor registered
  READY,           // Destination open, Ready sent
  RECEIVING,       // Reassembling chunks
  // Terminal
  COMPLETED,
  FAILED,
  CANCELLED
};

enum class TransferError {
  IO_ERROR,
  INVALID_PEER,
  INVALID_SETUP,
  UNKNOWN_TRANSFER,
  TIMEOUT,
  CANCELLED,
  ID_EXHAUSTED
};

const char* to_string(TransferState s);
const char* to_string(TransferError e);

bool is_terminal(TransferState s);

// ceil(total_bytes / bytes_per_chunk), 0 for an empty file.
uint64_t total_steps(uint64_t total_bytes, uint32_t bytes_per_chunk);

struct TransferDescriptor {
  TransferDirection direction = TransferDirection::UPLOAD;
  TransferId id = 0;
  PeerId sender_peer = 0;
  PeerId receiver_peer = 0;
  std::string path;
  uint64_t total_bytes = 0;
  uint32_t bytes_per_chunk = 0;
  int chunks_per_second = 0;

  // Written from the inbound message path, read by the owning task.
  std::atomic<uint64_t> sent_bytes{0};
  std::atomic<bool> client_ready{false};
  std::atomic<TransferState> state{TransferState::CREATED};

  uint64_t total_steps() const { return transfer::total_steps(total_bytes, bytes_per_chunk); }

  // The endpoint that is not local: the receiver for uploads, the sender for downloads.
  PeerId remote_peer() const {
    return direction == TransferDirection::UPLOAD ? receiver_peer : sender_peer;
  }

  // Returns the new total.
  uint64_t add_sent(uint64_t n) { return sent_bytes.fetch_add(n) + n; }

  std::string describe() const;
};

} // namespace pxf::transfer

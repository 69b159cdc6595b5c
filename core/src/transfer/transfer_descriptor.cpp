#include "pxf/transfer/transfer_descriptor.h"
#include <sstream>

namespace pxf::transfer {

const char* to_string(TransferState s) {
  switch (s) {
    case TransferState::CREATED: return "CREATED";
    case TransferState::AWAITING_READY: return "AWAITING_READY";
    case TransferState::STREAMING: return "STREAMING";
    case TransferState::SETUP_RECEIVED: return "SETUP_RECEIVED";
    case TransferState::READY: return "READY";
    case TransferState::RECEIVING: return "RECEIVING";
    case TransferState::COMPLETED: return "COMPLETED";
    case TransferState::FAILED: return "FAILED";
    case TransferState::CANCELLED: return "CANCELLED";
  }
  return "UNKNOWN";
}

const char* to_string(TransferError e) {
  switch (e) {
    case TransferError::IO_ERROR: return "IO_ERROR";
    case TransferError::INVALID_PEER: return "INVALID_PEER";
    case TransferError::INVALID_SETUP: return "INVALID_SETUP";
    case TransferError::UNKNOWN_TRANSFER: return "UNKNOWN_TRANSFER";
    case TransferError::TIMEOUT: return "TIMEOUT";
    case TransferError::CANCELLED: return "CANCELLED";
    case TransferError::ID_EXHAUSTED: return "ID_EXHAUSTED";
  }
  return "UNKNOWN";
}

bool is_terminal(TransferState s) {
  return s == TransferState::COMPLETED || s == TransferState::FAILED ||
         s == TransferState::CANCELLED;
}

uint64_t total_steps(uint64_t total_bytes, uint32_t bytes_per_chunk) {
  if (bytes_per_chunk == 0 || total_bytes == 0) return 0;
  return total_bytes / bytes_per_chunk + (total_bytes % bytes_per_chunk != 0 ? 1 : 0);
}

std::string TransferDescriptor::describe() const {
  std::ostringstream os;
  os << (direction == TransferDirection::UPLOAD ? "upload" : "download")
     << " id=" << id
     << " sender=" << sender_peer
     << " receiver=" << receiver_peer
     << " path=" << path
     << " bytes=" << sent_bytes.load() << "/" << total_bytes
     << " state=" << to_string(state.load());
  return os.str();
}

} // namespace pxf::transfer

#include "pxf/transfer/chunk_reassembler.h"

namespace pxf::transfer {

ChunkReassembler::ChunkReassembler(uint32_t window)
  : window_(window) {
}

ChunkReassembler::InsertResult ChunkReassembler::insert(uint64_t step, std::vector<uint8_t> data) {
  if (step < next_step_) {
    return InsertResult::DUPLICATE;
  }
  if (window_ > 0 && step - next_step_ >= window_) {
    return InsertResult::OUT_OF_WINDOW;
  }

  auto it = chunks_.find(step);
  if (it != chunks_.end()) {
    buffered_bytes_ -= it->second.size();
    buffered_bytes_ += data.size();
    it->second = std::move(data);
    return InsertResult::REPLACED;
  }

  buffered_bytes_ += data.size();
  chunks_.emplace(step, std::move(data));
  return InsertResult::STORED;
}

bool ChunkReassembler::has_next() const {
  return chunks_.count(next_step_) > 0;
}

std::optional<std::vector<uint8_t>> ChunkReassembler::take_next() {
  auto it = chunks_.find(next_step_);
  if (it == chunks_.end()) {
    return std::nullopt;
  }
  std::vector<uint8_t> data = std::move(it->second);
  chunks_.erase(it);
  buffered_bytes_ -= data.size();
  next_step_++;
  return data;
}

void ChunkReassembler::clear() {
  chunks_.clear();
  buffered_bytes_ = 0;
}

const char* to_string(ChunkReassembler::InsertResult r) {
  switch (r) {
    case ChunkReassembler::InsertResult::STORED: return "STORED";
    case ChunkReassembler::InsertResult::REPLACED: return "REPLACED";
    case ChunkReassembler::InsertResult::DUPLICATE: return "DUPLICATE";
    case ChunkReassembler::InsertResult::OUT_OF_WINDOW: return "OUT_OF_WINDOW";
  }
  return "UNKNOWN";
}

} // namespace pxf::transfer

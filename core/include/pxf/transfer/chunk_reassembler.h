#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace pxf::transfer {

// Buffers chunks of one transfer by step and releases them strictly in order.
// Only chunks in [next_step, next_step + window) are kept, so memory is
// bounded by the look-ahead window rather than by the file size.
class ChunkReassembler {
public:
  enum class InsertResult {
    STORED,        // New step buffered
    REPLACED,      // Step was already buffered, payload overwritten
    DUPLICATE,     // Step already written out, dropped
    OUT_OF_WINDOW  // Too far ahead of next_step, dropped
  };

  // window == 0 disables the look-ahead cap.
  explicit ChunkReassembler(uint32_t window = 1024);

  InsertResult insert(uint64_t step, std::vector<uint8_t> data);

  // Removes and returns the payload for next_step() if it has arrived, then
  // advances next_step().
  std::optional<std::vector<uint8_t>> take_next();

  bool has_next() const;
  uint64_t next_step() const { return next_step_; }
  size_t buffered() const { return chunks_.size(); }
  size_t buffered_bytes() const { return buffered_bytes_; }
  void clear();

private:
  uint32_t window_;
  uint64_t next_step_ = 0;
  size_t buffered_bytes_ = 0;
  std::map<uint64_t, std::vector<uint8_t>> chunks_;
};

const char* to_string(ChunkReassembler::InsertResult r);

} // namespace pxf::transfer

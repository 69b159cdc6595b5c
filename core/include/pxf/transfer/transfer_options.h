#pragma once

#include <cstdint>
#include <string>

namespace pxf::transfer {

struct TransferOptions {
  uint32_t bytes_per_chunk = 10000;
  // Approximate; 0 disables the pacing delay.
  int chunks_per_second = 10;
  double server_timeout_seconds = 5.0;
  double client_timeout_seconds = 15.0;
  double ready_poll_interval_seconds = 0.1;
  // Look-ahead cap of the reassembly buffer in chunks; 0 means unbounded.
  uint32_t reassembly_window = 1024;
  // Finished descriptors kept for inspection; 0 keeps none.
  size_t history_limit = 64;
  std::string download_dir = "./downloads";
  bool remove_partial_on_failure = false;
};

} // namespace pxf::transfer

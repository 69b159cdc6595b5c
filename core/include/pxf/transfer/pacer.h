#pragma once

#include <chrono>
#include <utility>
#include <boost/asio.hpp>

namespace pxf::transfer {

// Spaces chunk emissions roughly 1 / chunks_per_second apart. The time spent
// building and sending a chunk is not subtracted.
class Pacer {
public:
  explicit Pacer(int chunks_per_second)
    : chunks_per_second_(chunks_per_second) {}

  std::chrono::steady_clock::duration interval() const {
    if (chunks_per_second_ <= 0) return std::chrono::steady_clock::duration::zero();
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / chunks_per_second_));
  }

  // Arms the timer for one interval. A zero interval still completes
  // asynchronously, so the caller always yields between chunks.
  template <typename Handler>
  void pace(boost::asio::steady_timer& timer, Handler&& handler) const {
    timer.expires_after(interval());
    timer.async_wait(std::forward<Handler>(handler));
  }

  int chunks_per_second() const { return chunks_per_second_; }

private:
  int chunks_per_second_;
};

} // namespace pxf::transfer

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "pxf/storage/file_store.h"
#include "pxf/transfer/pacer.h"
#include "pxf/transfer/transfer_descriptor.h"

namespace pxf::transfer {

class TransferEngine;

// Sender side of one transfer:
//   CREATED -> AWAITING_READY -> STREAMING -> COMPLETED | FAILED | CANCELLED
// All member functions run on the engine's strand.
class UploadTask : public std::enable_shared_from_this<UploadTask> {
public:
  UploadTask(TransferEngine& engine,
             std::shared_ptr<TransferDescriptor> desc,
             storage::FileSource source);

  // Sends Setup and starts waiting for Ready.
  void start();

  // Wakes the readiness wait; desc->client_ready is already set.
  void notify_ready();

  void cancel();

  // Stops all pending work without touching the engine again.
  void detach();

  const std::shared_ptr<TransferDescriptor>& descriptor() const { return desc_; }
  bool finished() const { return finished_; }
  uint64_t chunks_sent() const { return step_; }

private:
  void wait_ready();
  void on_ready_wait(const boost::system::error_code& ec);
  void begin_streaming();
  void send_next_chunk();
  void on_paced(const boost::system::error_code& ec);

  void succeed();
  void fail(TransferError error, const std::string& reason);
  void finish(TransferState state, TransferError error, const std::string& reason);
  // Stops timers and closes the file; false when already terminal.
  bool settle(TransferState state);

  TransferEngine& engine_;
  std::shared_ptr<TransferDescriptor> desc_;
  storage::FileSource source_;
  boost::asio::steady_timer timer_;
  Pacer pacer_;
  std::chrono::steady_clock::time_point ready_wait_start_;
  uint64_t step_ = 0;
  bool finished_ = false;
};

} // namespace pxf::transfer

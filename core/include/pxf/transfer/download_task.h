#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "pxf/storage/file_store.h"
#include "pxf/transfer/chunk_reassembler.h"
#include "pxf/transfer/transfer_descriptor.h"

namespace pxf::transfer {

class TransferEngine;

// Receiver side of one transfer:
//   SETUP_RECEIVED -> READY -> RECEIVING -> COMPLETED | FAILED | CANCELLED
// All member functions run on the engine's strand.
class DownloadTask : public std::enable_shared_from_this<DownloadTask> {
public:
  DownloadTask(TransferEngine& engine, std::shared_ptr<TransferDescriptor> desc);

  // Opens the destination, sends Ready and starts the idle timer.
  void start();

  // Buffers one chunk and writes out everything that is now in order.
  void deliver(uint32_t step, std::vector<uint8_t> data);

  void cancel();
  void detach();

  const std::shared_ptr<TransferDescriptor>& descriptor() const { return desc_; }
  const ChunkReassembler& reassembler() const { return reassembler_; }
  bool finished() const { return finished_; }

private:
  void drain();
  void arm_idle_timer();
  void on_idle(const boost::system::error_code& ec);

  void succeed();
  void fail(TransferError error, const std::string& reason);
  void finish(TransferState state, TransferError error, const std::string& reason);
  // Stops timers and closes the file; false when already terminal.
  bool settle(TransferState state);

  TransferEngine& engine_;
  std::shared_ptr<TransferDescriptor> desc_;
  ChunkReassembler reassembler_;
  storage::FileSink sink_;
  boost::asio::steady_timer timer_;
  std::chrono::steady_clock::time_point last_chunk_time_;
  bool opened_ = false;
  bool finished_ = false;
};

} // namespace pxf::transfer

#include "pxf/transfer/download_task.h"
#include "pxf/log/logger.h"
#include "pxf/protocol/transfer_messages.h"
#include "pxf/transfer/transfer_engine.h"
#include <sstream>

namespace pxf::transfer {

using Clock = std::chrono::steady_clock;

DownloadTask::DownloadTask(TransferEngine& engine, std::shared_ptr<TransferDescriptor> desc)
  : engine_(engine),
    desc_(std::move(desc)),
    reassembler_(engine.options().reassembly_window),
    timer_(engine.strand()) {
}

void DownloadTask::start() {
  if (finished_) return;

  if (!engine_.store().initialize()) {
    fail(TransferError::IO_ERROR, "Can't create download directory " + engine_.store().base_path());
    return;
  }
  if (!sink_.open(desc_->path)) {
    fail(TransferError::IO_ERROR, "Can't write the target file: " + sink_.error());
    return;
  }
  opened_ = true;

  desc_->state = TransferState::READY;
  protocol::ReadyMsg ready;
  ready.receiver_peer = desc_->receiver_peer;
  ready.transfer_id = desc_->id;
  engine_.transport().send(desc_->sender_peer, ready.to_message());
  engine_.download_started(desc_);

  Logger::instance().info("Receiving " + desc_->path + " ... (" + desc_->describe() + ")");

  desc_->state = TransferState::RECEIVING;
  last_chunk_time_ = Clock::now();
  if (desc_->total_steps() == 0) {
    succeed();
    return;
  }
  arm_idle_timer();
}

void DownloadTask::deliver(uint32_t step, std::vector<uint8_t> data) {
  if (finished_) return;

  if (step >= desc_->total_steps() || data.size() > desc_->bytes_per_chunk) {
    Logger::instance().warn("download " + desc_->describe() + ": dropping malformed chunk step=" +
                            std::to_string(step) + " len=" + std::to_string(data.size()));
    return;
  }

  auto r = reassembler_.insert(step, std::move(data));
  if (r == ChunkReassembler::InsertResult::OUT_OF_WINDOW ||
      r == ChunkReassembler::InsertResult::DUPLICATE) {
    Logger::instance().debug("download " + desc_->describe() + ": chunk " + std::to_string(step) +
                             " " + to_string(r));
    return;
  }
  drain();
}

void DownloadTask::drain() {
  bool progressed = false;
  while (auto data = reassembler_.take_next()) {
    if (!sink_.write(*data)) {
      fail(TransferError::IO_ERROR, "Can't write the target file: " + sink_.error());
      return;
    }
    desc_->add_sent(data->size());
    progressed = true;
  }

  if (reassembler_.next_step() >= desc_->total_steps()) {
    succeed();
    return;
  }
  if (progressed) {
    last_chunk_time_ = Clock::now();
    arm_idle_timer();
  }
}

void DownloadTask::arm_idle_timer() {
  auto timeout = std::chrono::duration_cast<Clock::duration>(
      std::chrono::duration<double>(engine_.options().client_timeout_seconds));
  // Re-arming aborts the previous wait.
  timer_.expires_at(last_chunk_time_ + timeout);
  auto self = shared_from_this();
  timer_.async_wait([self](const boost::system::error_code& ec) {
    self->on_idle(ec);
  });
}

void DownloadTask::on_idle(const boost::system::error_code& ec) {
  if (finished_ || ec == boost::asio::error::operation_aborted) return;

  auto timeout = std::chrono::duration<double>(engine_.options().client_timeout_seconds);
  if (Clock::now() - last_chunk_time_ >= timeout) {
    std::ostringstream os;
    os << "Timeout: no response from the server for "
       << engine_.options().client_timeout_seconds << " seconds";
    fail(TransferError::TIMEOUT, os.str());
    return;
  }
  arm_idle_timer();
}

void DownloadTask::cancel() {
  if (finished_) return;
  finish(TransferState::CANCELLED, TransferError::CANCELLED, "Cancelled");
}

void DownloadTask::detach() {
  finished_ = true;
  timer_.cancel();
  sink_.close();
}

void DownloadTask::succeed() {
  if (!sink_.close()) {
    fail(TransferError::IO_ERROR, "Can't write the target file: " + sink_.error());
    return;
  }
  if (desc_->sent_bytes.load() != desc_->total_bytes) {
    fail(TransferError::IO_ERROR, "size mismatch: received " + std::to_string(desc_->sent_bytes.load()) +
                                  " of " + std::to_string(desc_->total_bytes) + " bytes");
    return;
  }
  if (!settle(TransferState::COMPLETED)) return;
  engine_.download_succeeded(shared_from_this());
}

void DownloadTask::fail(TransferError error, const std::string& reason) {
  finish(TransferState::FAILED, error, reason);
}

void DownloadTask::finish(TransferState state, TransferError error, const std::string& reason) {
  if (!settle(state)) return;
  engine_.download_failed(shared_from_this(), error, reason);
}

bool DownloadTask::settle(TransferState state) {
  if (finished_) return false;
  finished_ = true;
  timer_.cancel();
  bool closed = sink_.close();
  reassembler_.clear();

  if (opened_ && state != TransferState::COMPLETED && engine_.options().remove_partial_on_failure) {
    engine_.store().remove_file(desc_->path);
  } else if (!closed) {
    Logger::instance().warn("download " + desc_->describe() + ": " + sink_.error());
  }

  engine_.store().release_destination(desc_->path);

  desc_->state = state;
  return true;
}

} // namespace pxf::transfer

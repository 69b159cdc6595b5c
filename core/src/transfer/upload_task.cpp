#include "pxf/transfer/upload_task.h"
#include "pxf/log/logger.h"
#include "pxf/protocol/transfer_messages.h"
#include "pxf/transfer/transfer_engine.h"
#include <algorithm>

namespace pxf::transfer {

using Clock = std::chrono::steady_clock;

static Clock::duration seconds_to_duration(double s) {
  return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(s));
}

UploadTask::UploadTask(TransferEngine& engine,
                       std::shared_ptr<TransferDescriptor> desc,
                       storage::FileSource source)
  : engine_(engine),
    desc_(std::move(desc)),
    source_(std::move(source)),
    timer_(engine.strand()),
    pacer_(desc_->chunks_per_second) {
}

void UploadTask::start() {
  if (finished_) return;

  protocol::SetupMsg setup;
  setup.path = desc_->path;
  setup.sender_peer = desc_->sender_peer;
  setup.total_bytes = desc_->total_bytes;
  setup.bytes_per_chunk = desc_->bytes_per_chunk;
  setup.transfer_id = desc_->id;

  protocol::Message msg;
  try {
    msg = setup.to_message();
  } catch (const std::exception& e) {
    fail(TransferError::IO_ERROR, e.what());
    return;
  }

  desc_->state = TransferState::AWAITING_READY;
  engine_.transport().send(desc_->receiver_peer, msg);
  Logger::instance().info("upload " + desc_->describe() + ": setup sent");

  ready_wait_start_ = Clock::now();
  wait_ready();
}

void UploadTask::wait_ready() {
  if (desc_->client_ready.load()) {
    begin_streaming();
    return;
  }

  const auto& opts = engine_.options();
  auto deadline = ready_wait_start_ + seconds_to_duration(opts.server_timeout_seconds);
  auto now = Clock::now();
  if (now >= deadline) {
    fail(TransferError::TIMEOUT, "Timeout: no response from the client");
    return;
  }

  // Re-check every poll interval; notify_ready() cuts the wait short.
  auto next = now + seconds_to_duration(opts.ready_poll_interval_seconds);
  timer_.expires_at(std::min(next, deadline));
  auto self = shared_from_this();
  timer_.async_wait([self](const boost::system::error_code& ec) {
    self->on_ready_wait(ec);
  });
}

void UploadTask::on_ready_wait(const boost::system::error_code&) {
  // Aborted waits come from notify_ready() or cancel(); both re-check state.
  if (finished_ || desc_->state.load() != TransferState::AWAITING_READY) return;
  wait_ready();
}

void UploadTask::notify_ready() {
  if (finished_ || desc_->state.load() != TransferState::AWAITING_READY) return;
  timer_.cancel();
}

void UploadTask::begin_streaming() {
  desc_->state = TransferState::STREAMING;
  Logger::instance().info("upload " + desc_->describe() + ": client ready, streaming " +
                          std::to_string(desc_->total_steps()) + " chunks");
  send_next_chunk();
}

void UploadTask::send_next_chunk() {
  if (finished_) return;

  if (step_ >= desc_->total_steps()) {
    succeed();
    return;
  }

  uint64_t remaining = desc_->total_bytes - desc_->sent_bytes.load();
  size_t want = static_cast<size_t>(std::min<uint64_t>(desc_->bytes_per_chunk, remaining));

  protocol::ChunkMsg chunk;
  chunk.sender_peer = desc_->sender_peer;
  chunk.transfer_id = desc_->id;
  chunk.step = static_cast<uint32_t>(step_);
  if (!source_.read(chunk.data, want)) {
    fail(TransferError::IO_ERROR, "Can't read the source file: " + source_.error());
    return;
  }
  if (chunk.data.size() != want) {
    fail(TransferError::IO_ERROR, "Can't read the source file: unexpected end of file at byte " +
                                  std::to_string(desc_->sent_bytes.load() + chunk.data.size()));
    return;
  }

  size_t len = chunk.data.size();
  engine_.transport().send(desc_->receiver_peer, chunk.to_message());
  desc_->add_sent(len);
  step_++;

  if (step_ >= desc_->total_steps()) {
    succeed();
    return;
  }

  auto self = shared_from_this();
  pacer_.pace(timer_, [self](const boost::system::error_code& ec) {
    self->on_paced(ec);
  });
}

void UploadTask::on_paced(const boost::system::error_code& ec) {
  if (finished_) return;
  if (ec && ec != boost::asio::error::operation_aborted) {
    fail(TransferError::IO_ERROR, "pacing timer: " + ec.message());
    return;
  }
  send_next_chunk();
}

void UploadTask::cancel() {
  if (finished_) return;
  finish(TransferState::CANCELLED, TransferError::CANCELLED, "Cancelled");
}

void UploadTask::detach() {
  finished_ = true;
  timer_.cancel();
  source_.close();
}

void UploadTask::succeed() {
  if (!settle(TransferState::COMPLETED)) return;
  engine_.upload_succeeded(shared_from_this());
}

void UploadTask::fail(TransferError error, const std::string& reason) {
  finish(TransferState::FAILED, error, reason);
}

void UploadTask::finish(TransferState state, TransferError error, const std::string& reason) {
  if (!settle(state)) return;
  engine_.upload_failed(shared_from_this(), error, reason);
}

bool UploadTask::settle(TransferState state) {
  if (finished_) return false;
  finished_ = true;
  timer_.cancel();
  source_.close();
  desc_->state = state;
  return true;
}

} // namespace pxf::transfer

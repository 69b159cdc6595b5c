#include "pxf/transfer/transfer_engine.h"
#include "pxf/log/logger.h"
#include "pxf/protocol/transfer_messages.h"
#include "pxf/transfer/download_task.h"
#include "pxf/transfer/upload_task.h"
#include <stdexcept>

namespace pxf::transfer {

// Steps travel as u32 on the wire.
static constexpr uint64_t MAX_STEPS = 0x100000000ULL;

TransferEngine::TransferEngine(boost::asio::io_context& io,
                               net::Transport& transport,
                               const net::PeerDirectory& peers,
                               TransferRegistry& registry,
                               TransferOptions options)
  : strand_(boost::asio::make_strand(io)),
    transport_(transport),
    peers_(peers),
    registry_(registry),
    options_(std::move(options)),
    store_(options_.download_dir) {
  if (options_.bytes_per_chunk == 0) {
    throw std::invalid_argument("bytes_per_chunk must be positive");
  }
  if (options_.bytes_per_chunk > protocol::MAX_PAYLOAD - 16) {
    throw std::invalid_argument("bytes_per_chunk does not fit in one frame");
  }

  handlers_[protocol::MsgType::TRANSFER_SETUP] = [this](const protocol::Message& m) { on_setup(m); };
  handlers_[protocol::MsgType::TRANSFER_READY] = [this](const protocol::Message& m) { on_ready(m); };
  handlers_[protocol::MsgType::TRANSFER_CHUNK] = [this](const protocol::Message& m) { on_chunk(m); };
}

TransferEngine::~TransferEngine() {
  for (auto& pair : uploads_) pair.second->detach();
  for (auto& pair : downloads_) pair.second->detach();
}

void TransferEngine::set_events(TransferEvents events) {
  events_ = std::move(events);
}

DescriptorPtr TransferEngine::send_file(const std::string& path, PeerId target) {
  auto desc = std::make_shared<TransferDescriptor>();
  desc->direction = TransferDirection::UPLOAD;
  desc->path = path;
  desc->bytes_per_chunk = options_.bytes_per_chunk;
  desc->chunks_per_second = options_.chunks_per_second;
  desc->sender_peer = transport_.local_peer();
  desc->receiver_peer = target;

  storage::FileSource source;
  if (!source.open(path)) {
    Logger::instance().error("[upload] Can't read the target file. Details: " + source.error());
    desc->state = TransferState::FAILED;
    boost::asio::post(strand_, [this, desc, reason = source.error()]() {
      emit_upload_failed(desc, TransferError::IO_ERROR, "Can't read the target file: " + reason);
    });
    return nullptr;
  }
  desc->total_bytes = source.size();

  if (desc->total_steps() > MAX_STEPS) {
    desc->state = TransferState::FAILED;
    boost::asio::post(strand_, [this, desc]() {
      emit_upload_failed(desc, TransferError::IO_ERROR, "file too large for the configured chunk size");
    });
    return nullptr;
  }

  try {
    registry_.register_upload(desc);
  } catch (const std::exception& e) {
    Logger::instance().error(std::string("[upload] Can't allocate a transfer id. Details: ") + e.what());
    desc->state = TransferState::FAILED;
    boost::asio::post(strand_, [this, desc, reason = std::string(e.what())]() {
      emit_upload_failed(desc, TransferError::ID_EXHAUSTED, reason);
    });
    return nullptr;
  }

  auto task = std::make_shared<UploadTask>(*this, desc, std::move(source));
  boost::asio::post(strand_, [this, task]() {
    const auto& d = task->descriptor();
    uploads_[TransferKey{d->receiver_peer, d->id}] = task;
    task->start();
  });
  return desc;
}

void TransferEngine::handle(const protocol::Message& msg) {
  boost::asio::post(strand_, [this, msg]() { dispatch(msg); });
}

void TransferEngine::dispatch(const protocol::Message& msg) {
  auto it = handlers_.find(msg.type);
  if (it == handlers_.end()) {
    Logger::instance().warn("dropping message of unknown type " +
                            std::to_string(static_cast<int>(msg.type)));
    return;
  }
  try {
    it->second(msg);
  } catch (const std::exception& e) {
    Logger::instance().warn(std::string("dropping malformed ") + protocol::to_string(msg.type) +
                            ": " + e.what());
  }
}

void TransferEngine::on_setup(const protocol::Message& m) {
  auto setup = protocol::SetupMsg::deserialize(m.payload);

  auto desc = std::make_shared<TransferDescriptor>();
  desc->direction = TransferDirection::DOWNLOAD;
  desc->id = setup.transfer_id;
  desc->sender_peer = setup.sender_peer;
  desc->receiver_peer = transport_.local_peer();
  desc->path = store_.destination_path(setup.path);
  desc->total_bytes = setup.total_bytes;
  desc->bytes_per_chunk = setup.bytes_per_chunk;
  desc->state = TransferState::SETUP_RECEIVED;

  if (!peers_.resolve(setup.sender_peer)) {
    reject_setup(desc, TransferError::INVALID_PEER,
                 "Incorrect server ID: the received server ID doesn't match any peer");
    return;
  }
  if (setup.bytes_per_chunk == 0) {
    reject_setup(desc, TransferError::INVALID_SETUP, "invalid chunk size 0");
    return;
  }
  if (desc->total_steps() > MAX_STEPS) {
    reject_setup(desc, TransferError::INVALID_SETUP, "too many chunks");
    return;
  }

  // Two active downloads never share an output file.
  desc->path = store_.reserve_destination(setup.path);
  if (!registry_.add(Collection::DOWNLOADS, desc)) {
    store_.release_destination(desc->path);
    Logger::instance().warn("ignoring duplicate setup for " + desc->describe());
    return;
  }

  auto task = std::make_shared<DownloadTask>(*this, desc);
  downloads_[TransferKey{desc->sender_peer, desc->id}] = task;
  task->start();
}

void TransferEngine::reject_setup(const DescriptorPtr& desc, TransferError error, const std::string& reason) {
  desc->state = TransferState::FAILED;
  Logger::instance().error("[download] rejected setup " + desc->describe() + ": " + reason);
  emit_download_failed(desc, error, reason);
}

void TransferEngine::on_ready(const protocol::Message& m) {
  auto ready = protocol::ReadyMsg::deserialize(m.payload);

  auto desc = registry_.find(Collection::UPLOADS, ready.receiver_peer, ready.transfer_id);
  if (!desc) {
    Logger::instance().debug("ready for unknown upload peer=" + std::to_string(ready.receiver_peer) +
                             " id=" + std::to_string(ready.transfer_id));
    return;
  }
  desc->client_ready = true;

  auto it = uploads_.find(TransferKey{desc->receiver_peer, desc->id});
  if (it != uploads_.end()) {
    it->second->notify_ready();
  }
}

void TransferEngine::on_chunk(const protocol::Message& m) {
  auto chunk = protocol::ChunkMsg::deserialize(m.payload);

  // No such transfer initialized: stale or erroneous, dropped silently.
  auto desc = registry_.find(Collection::DOWNLOADS, chunk.sender_peer, chunk.transfer_id);
  if (!desc) {
    Logger::instance().debug("chunk for unknown download peer=" + std::to_string(chunk.sender_peer) +
                             " id=" + std::to_string(chunk.transfer_id) +
                             " step=" + std::to_string(chunk.step));
    return;
  }

  auto it = downloads_.find(TransferKey{desc->sender_peer, desc->id});
  if (it != downloads_.end()) {
    it->second->deliver(chunk.step, std::move(chunk.data));
  }
}

bool TransferEngine::cancel_upload(PeerId receiver_peer, TransferId id) {
  auto desc = registry_.find(Collection::UPLOADS, receiver_peer, id);
  if (!desc) return false;

  TransferKey key{desc->receiver_peer, desc->id};
  boost::asio::post(strand_, [this, key]() {
    auto it = uploads_.find(key);
    if (it != uploads_.end()) {
      auto task = it->second;
      task->cancel();
    }
  });
  return true;
}

bool TransferEngine::cancel_download(PeerId sender_peer, TransferId id) {
  auto desc = registry_.find(Collection::DOWNLOADS, sender_peer, id);
  if (!desc) return false;

  TransferKey key{desc->sender_peer, desc->id};
  boost::asio::post(strand_, [this, key]() {
    auto it = downloads_.find(key);
    if (it != downloads_.end()) {
      auto task = it->second;
      task->cancel();
    }
  });
  return true;
}

void TransferEngine::retire_upload(const DescriptorPtr& desc) {
  registry_.remove(Collection::UPLOADS, desc);
  uploads_.erase(TransferKey{desc->receiver_peer, desc->id});
}

void TransferEngine::upload_succeeded(const std::shared_ptr<UploadTask>& task) {
  const auto desc = task->descriptor();
  retire_upload(desc);
  Logger::instance().info("[upload] done " + desc->describe());
  if (events_.on_upload_succeeded) events_.on_upload_succeeded(desc);
}

void TransferEngine::upload_failed(const std::shared_ptr<UploadTask>& task, TransferError error,
                                   const std::string& reason) {
  const auto desc = task->descriptor();
  retire_upload(desc);
  Logger::instance().error("[upload] failed " + desc->describe() + ": " + reason);
  emit_upload_failed(desc, error, reason);
}

void TransferEngine::download_started(const DescriptorPtr& desc) {
  if (events_.on_download_started) events_.on_download_started(desc);
}

void TransferEngine::retire_download(const DescriptorPtr& desc) {
  registry_.remove(Collection::DOWNLOADS, desc);
  downloads_.erase(TransferKey{desc->sender_peer, desc->id});
}

void TransferEngine::download_succeeded(const std::shared_ptr<DownloadTask>& task) {
  const auto desc = task->descriptor();
  retire_download(desc);
  Logger::instance().info("[download] done " + desc->describe());
  if (events_.on_download_succeeded) events_.on_download_succeeded(desc);
}

void TransferEngine::download_failed(const std::shared_ptr<DownloadTask>& task, TransferError error,
                                     const std::string& reason) {
  const auto desc = task->descriptor();
  retire_download(desc);
  Logger::instance().error("[download] failed " + desc->describe() + ": " + reason);
  emit_download_failed(desc, error, reason);
}

void TransferEngine::emit_upload_failed(const DescriptorPtr& desc, TransferError error, const std::string& reason) {
  if (events_.on_upload_failed) events_.on_upload_failed(desc, error, reason);
}

void TransferEngine::emit_download_failed(const DescriptorPtr& desc, TransferError error, const std::string& reason) {
  if (events_.on_download_failed) events_.on_download_failed(desc, error, reason);
}

} // namespace pxf::transfer

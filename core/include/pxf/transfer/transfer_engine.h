#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <boost/asio.hpp>
#include "pxf/common/types.h"
#include "pxf/net/peer_directory.h"
#include "pxf/net/transport.h"
#include "pxf/protocol/message.h"
#include "pxf/storage/file_store.h"
#include "pxf/transfer/transfer_descriptor.h"
#include "pxf/transfer/transfer_options.h"
#include "pxf/transfer/transfer_registry.h"

namespace pxf::transfer {

class UploadTask;
class DownloadTask;

using DescriptorPtr = std::shared_ptr<TransferDescriptor>;

// Every terminal transfer produces exactly one succeeded or failed event.
// Events run on the engine's strand.
struct TransferEvents {
  std::function<void(const DescriptorPtr&)> on_upload_succeeded;
  std::function<void(const DescriptorPtr&, TransferError, const std::string&)> on_upload_failed;
  std::function<void(const DescriptorPtr&)> on_download_started;
  std::function<void(const DescriptorPtr&)> on_download_succeeded;
  std::function<void(const DescriptorPtr&, TransferError, const std::string&)> on_download_failed;
};

// Hosts the sender and receiver state machines of one peer.
//
// Inbound messages are dispatched by kind through a handler table; all task
// and handler code runs on one strand, so the engine itself tolerates an
// io_context run by any number of threads. The transport may be stricter
// (TcpTransport needs a single thread). The engine must outlive every handler
// it posted: destroy it only after the io_context has stopped.
class TransferEngine {
public:
  using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

  TransferEngine(boost::asio::io_context& io,
                 net::Transport& transport,
                 const net::PeerDirectory& peers,
                 TransferRegistry& registry,
                 TransferOptions options = TransferOptions());
  ~TransferEngine();

  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;

  void set_events(TransferEvents events);

  // Sends the file at path to target. The source is opened and sized here;
  // on failure the upload-failed event is emitted with IO_ERROR and nullptr is
  // returned without registering or announcing anything.
  DescriptorPtr send_file(const std::string& path, PeerId target);

  // Entry point for the transport. Thread-safe.
  void handle(const protocol::Message& msg);

  // Abort an active transfer. The failure event carries CANCELLED.
  // Return false if the transfer is not active.
  bool cancel_upload(PeerId receiver_peer, TransferId id);
  bool cancel_download(PeerId sender_peer, TransferId id);

  size_t active_uploads() const { return registry_.count(Collection::UPLOADS); }
  size_t active_downloads() const { return registry_.count(Collection::DOWNLOADS); }

  const TransferOptions& options() const { return options_; }
  TransferRegistry& registry() { return registry_; }
  Strand& strand() { return strand_; }
  net::Transport& transport() { return transport_; }
  storage::FileStore& store() { return store_; }

private:
  friend class UploadTask;
  friend class DownloadTask;

  using Handler = std::function<void(const protocol::Message&)>;

  void dispatch(const protocol::Message& msg);
  void on_setup(const protocol::Message& msg);
  void on_ready(const protocol::Message& msg);
  void on_chunk(const protocol::Message& msg);

  void reject_setup(const DescriptorPtr& desc, TransferError error, const std::string& reason);

  // Called by the tasks once they reach a terminal state.
  void upload_succeeded(const std::shared_ptr<UploadTask>& task);
  void upload_failed(const std::shared_ptr<UploadTask>& task, TransferError error, const std::string& reason);
  void download_started(const DescriptorPtr& desc);
  void download_succeeded(const std::shared_ptr<DownloadTask>& task);
  void download_failed(const std::shared_ptr<DownloadTask>& task, TransferError error, const std::string& reason);
  void retire_upload(const DescriptorPtr& desc);
  void retire_download(const DescriptorPtr& desc);

  void emit_upload_failed(const DescriptorPtr& desc, TransferError error, const std::string& reason);
  void emit_download_failed(const DescriptorPtr& desc, TransferError error, const std::string& reason);

  Strand strand_;
  net::Transport& transport_;
  const net::PeerDirectory& peers_;
  TransferRegistry& registry_;
  TransferOptions options_;
  storage::FileStore store_;
  TransferEvents events_;

  std::unordered_map<protocol::MsgType, Handler> handlers_;

  // Strand-only.
  std::unordered_map<TransferKey, std::shared_ptr<UploadTask>, TransferKeyHash> uploads_;
  std::unordered_map<TransferKey, std::shared_ptr<DownloadTask>, TransferKeyHash> downloads_;
};

} // namespace pxf::transfer

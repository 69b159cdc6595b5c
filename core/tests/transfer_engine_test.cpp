#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <chrono>
#include <filesystem>
#include <set>
#include "loopback_transport.h"
#include "pxf/net/peer_directory.h"
#include "pxf/transfer/transfer_engine.h"
#include "pxf/transfer/transfer_registry.h"
#include "test_util.h"

using namespace pxf;
using namespace pxf::transfer;
using pxf::protocol::MsgType;

namespace {

constexpr PeerId SENDER = 1;
constexpr PeerId RECEIVER = 2;

struct Failure {
  DescriptorPtr desc;
  TransferError error;
  std::string reason;
};

struct Recorder {
  std::vector<DescriptorPtr> uploads_ok;
  std::vector<Failure> uploads_failed;
  std::vector<DescriptorPtr> downloads_started;
  std::vector<DescriptorPtr> downloads_ok;
  std::vector<Failure> downloads_failed;

  TransferEvents events() {
    TransferEvents e;
    e.on_upload_succeeded = [this](const DescriptorPtr& d) { uploads_ok.push_back(d); };
    e.on_upload_failed = [this](const DescriptorPtr& d, TransferError err, const std::string& r) {
      uploads_failed.push_back(Failure{d, err, r});
    };
    e.on_download_started = [this](const DescriptorPtr& d) { downloads_started.push_back(d); };
    e.on_download_succeeded = [this](const DescriptorPtr& d) { downloads_ok.push_back(d); };
    e.on_download_failed = [this](const DescriptorPtr& d, TransferError err, const std::string& r) {
      downloads_failed.push_back(Failure{d, err, r});
    };
    return e;
  }
};

TransferOptions fast_options(const std::string& download_dir) {
  TransferOptions o;
  o.bytes_per_chunk = 10000;
  o.chunks_per_second = 1000;
  o.server_timeout_seconds = 0.5;
  o.client_timeout_seconds = 0.5;
  o.ready_poll_interval_seconds = 0.01;
  o.download_dir = download_dir;
  return o;
}

} // namespace

class TransferEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    sender_peers.add(net::Peer{RECEIVER, "127.0.0.1", 9002});
    receiver_peers.add(net::Peer{SENDER, "127.0.0.1", 9001});
    recv_dir = tmp.file("recv");
  }

  void make_engines(TransferOptions sender_opts, TransferOptions receiver_opts) {
    sender = std::make_unique<TransferEngine>(io, sender_transport, sender_peers, sender_registry, sender_opts);
    receiver = std::make_unique<TransferEngine>(io, receiver_transport, receiver_peers, receiver_registry,
                                                receiver_opts);
    sender->set_events(sender_events.events());
    receiver->set_events(receiver_events.events());
    hub.attach(SENDER, sender.get());
    hub.attach(RECEIVER, receiver.get());
  }

  void make_engines() { make_engines(fast_options(tmp.file("unused")), fast_options(recv_dir)); }

  void run() { io.run_for(std::chrono::seconds(10)); }

  std::string source_file(const std::string& name, size_t size) {
    std::string path = tmp.file(name);
    test::write_file(path, test::pattern_bytes(size, static_cast<uint32_t>(size)));
    return path;
  }

  std::string received(const std::string& name) const {
    return (std::filesystem::path(recv_dir) / name).string();
  }

  test::TempDir tmp;
  std::string recv_dir;
  boost::asio::io_context io;
  test::LoopbackHub hub;
  test::LoopbackTransport sender_transport{hub, SENDER};
  test::LoopbackTransport receiver_transport{hub, RECEIVER};
  net::StaticPeerDirectory sender_peers;
  net::StaticPeerDirectory receiver_peers;
  TransferRegistry sender_registry;
  TransferRegistry receiver_registry;
  Recorder sender_events;
  Recorder receiver_events;
  std::unique_ptr<TransferEngine> sender;
  std::unique_ptr<TransferEngine> receiver;
};

TEST_F(TransferEngineTest, RoundTripProducesIdenticalFile) {
  make_engines();
  std::string src = source_file("report.bin", 25000);

  auto desc = sender->send_file(src, RECEIVER);
  ASSERT_NE(desc, nullptr);
  EXPECT_EQ(desc->id, TransferRegistry::ID_SEED);
  EXPECT_EQ(desc->total_bytes, 25000u);
  EXPECT_EQ(desc->total_steps(), 3u);
  run();

  ASSERT_EQ(sender_events.uploads_ok.size(), 1u);
  ASSERT_EQ(receiver_events.downloads_ok.size(), 1u);
  EXPECT_TRUE(sender_events.uploads_failed.empty());
  EXPECT_TRUE(receiver_events.downloads_failed.empty());

  EXPECT_EQ(hub.chunk_sizes(), (std::vector<size_t>{10000, 10000, 5000}));
  EXPECT_EQ(hub.count(MsgType::TRANSFER_SETUP), 1u);
  EXPECT_EQ(hub.count(MsgType::TRANSFER_READY), 1u);

  EXPECT_EQ(desc->sent_bytes.load(), desc->total_bytes);
  EXPECT_EQ(desc->state.load(), TransferState::COMPLETED);
  auto down = receiver_events.downloads_ok[0];
  EXPECT_EQ(down->sent_bytes.load(), 25000u);
  EXPECT_EQ(down->sender_peer, SENDER);
  EXPECT_EQ(down->receiver_peer, RECEIVER);
  EXPECT_EQ(down->path, received("report.bin"));

  EXPECT_EQ(test::read_file(received("report.bin")), test::read_file(src));

  EXPECT_EQ(sender->active_uploads(), 0u);
  EXPECT_EQ(receiver->active_downloads(), 0u);
  ASSERT_EQ(sender_registry.history().size(), 1u);
  EXPECT_EQ(sender_registry.history()[0], desc);
}

TEST_F(TransferEngineTest, ReverseOrderDeliveryStillReassembles) {
  make_engines();
  std::string src = source_file("reverse.bin", 47123);
  hub.hold_chunks = true;

  TransferEvents ev = sender_events.events();
  ev.on_upload_succeeded = [this](const DescriptorPtr& d) {
    sender_events.uploads_ok.push_back(d);
    hub.release_held_reversed();
  };
  sender->set_events(ev);

  ASSERT_NE(sender->send_file(src, RECEIVER), nullptr);
  run();

  ASSERT_EQ(receiver_events.downloads_ok.size(), 1u);
  EXPECT_EQ(hub.chunk_sizes().size(), 5u);
  EXPECT_EQ(test::read_file(received("reverse.bin")), test::read_file(src));
  EXPECT_EQ(receiver_events.downloads_ok[0]->sent_bytes.load(), 47123u);
}

TEST_F(TransferEngineTest, ShuffledDeliveryWithDuplicatesStillReassembles) {
  make_engines();
  std::string src = source_file("shuffled.bin", 60000);
  hub.hold_chunks = true;

  TransferEvents ev = sender_events.events();
  ev.on_upload_succeeded = [this](const DescriptorPtr&) {
    hub.release_held({3, 1, 1, 5, 0, 4, 3, 2});
  };
  sender->set_events(ev);

  ASSERT_NE(sender->send_file(src, RECEIVER), nullptr);
  run();

  ASSERT_EQ(receiver_events.downloads_ok.size(), 1u);
  EXPECT_TRUE(receiver_events.downloads_failed.empty());
  EXPECT_EQ(test::read_file(received("shuffled.bin")), test::read_file(src));
  EXPECT_EQ(receiver_events.downloads_ok[0]->sent_bytes.load(), 60000u);
}

TEST_F(TransferEngineTest, EmptyFileCompletesAfterHandshake) {
  make_engines();
  std::string src = source_file("empty.bin", 0);

  auto desc = sender->send_file(src, RECEIVER);
  ASSERT_NE(desc, nullptr);
  EXPECT_EQ(desc->total_steps(), 0u);
  run();

  ASSERT_EQ(sender_events.uploads_ok.size(), 1u);
  ASSERT_EQ(receiver_events.downloads_ok.size(), 1u);
  EXPECT_EQ(hub.count(MsgType::TRANSFER_READY), 1u);
  EXPECT_EQ(hub.count(MsgType::TRANSFER_CHUNK), 0u);
  EXPECT_EQ(desc->sent_bytes.load(), 0u);
  EXPECT_TRUE(std::filesystem::exists(received("empty.bin")));
  EXPECT_EQ(std::filesystem::file_size(received("empty.bin")), 0u);
}

TEST_F(TransferEngineTest, MissingReadyTimesOutWithoutSendingChunks) {
  make_engines();
  std::string src = source_file("noready.bin", 15000);
  hub.drop_ready = true;

  auto start = std::chrono::steady_clock::now();
  auto desc = sender->send_file(src, RECEIVER);
  ASSERT_NE(desc, nullptr);
  run();
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_EQ(sender_events.uploads_failed.size(), 1u);
  EXPECT_TRUE(sender_events.uploads_ok.empty());
  EXPECT_EQ(sender_events.uploads_failed[0].error, TransferError::TIMEOUT);
  EXPECT_EQ(sender_events.uploads_failed[0].reason, "Timeout: no response from the client");
  EXPECT_EQ(sender_events.uploads_failed[0].desc, desc);
  EXPECT_EQ(hub.count(MsgType::TRANSFER_CHUNK), 0u);
  EXPECT_GE(elapsed, std::chrono::milliseconds(500));
  EXPECT_FALSE(desc->client_ready.load());
  EXPECT_EQ(sender->active_uploads(), 0u);
}

TEST_F(TransferEngineTest, UnknownSenderFailsBothSides) {
  receiver_peers.remove(SENDER);
  make_engines();
  std::string src = source_file("stranger.bin", 12000);

  ASSERT_NE(sender->send_file(src, RECEIVER), nullptr);
  run();

  ASSERT_EQ(receiver_events.downloads_failed.size(), 1u);
  EXPECT_EQ(receiver_events.downloads_failed[0].error, TransferError::INVALID_PEER);
  EXPECT_TRUE(receiver_events.downloads_started.empty());
  EXPECT_EQ(receiver_registry.count(Collection::DOWNLOADS), 0u);
  EXPECT_TRUE(receiver_registry.history().empty());
  EXPECT_EQ(hub.count(MsgType::TRANSFER_READY), 0u);
  EXPECT_FALSE(std::filesystem::exists(received("stranger.bin")));

  ASSERT_EQ(sender_events.uploads_failed.size(), 1u);
  EXPECT_EQ(sender_events.uploads_failed[0].error, TransferError::TIMEOUT);
  EXPECT_EQ(hub.count(MsgType::TRANSFER_CHUNK), 0u);
}

TEST_F(TransferEngineTest, UnreadableSourceFailsBeforeAnnouncing) {
  make_engines();

  auto desc = sender->send_file(tmp.file("does-not-exist.bin"), RECEIVER);
  EXPECT_EQ(desc, nullptr);
  run();

  ASSERT_EQ(sender_events.uploads_failed.size(), 1u);
  EXPECT_EQ(sender_events.uploads_failed[0].error, TransferError::IO_ERROR);
  EXPECT_TRUE(hub.sent.empty());
  EXPECT_EQ(sender_registry.count(Collection::UPLOADS), 0u);
  EXPECT_TRUE(sender_registry.history().empty());
}

TEST_F(TransferEngineTest, UnwritableDestinationFailsReceiver) {
  // The download directory is a regular file, so nothing can be created in it.
  test::write_file(recv_dir, {1, 2, 3});
  make_engines();
  std::string src = source_file("blocked.bin", 5000);

  ASSERT_NE(sender->send_file(src, RECEIVER), nullptr);
  run();

  ASSERT_EQ(receiver_events.downloads_failed.size(), 1u);
  EXPECT_EQ(receiver_events.downloads_failed[0].error, TransferError::IO_ERROR);
  EXPECT_EQ(hub.count(MsgType::TRANSFER_READY), 0u);
  EXPECT_EQ(receiver->active_downloads(), 0u);

  ASSERT_EQ(sender_events.uploads_failed.size(), 1u);
  EXPECT_EQ(sender_events.uploads_failed[0].error, TransferError::TIMEOUT);
}

TEST_F(TransferEngineTest, MissingChunkTriggersClientTimeout) {
  make_engines();
  std::string src = source_file("gap.bin", 30000);
  hub.drop_chunk_steps.insert(1);

  ASSERT_NE(sender->send_file(src, RECEIVER), nullptr);
  run();

  // The sender does not know about the loss.
  ASSERT_EQ(sender_events.uploads_ok.size(), 1u);

  ASSERT_EQ(receiver_events.downloads_failed.size(), 1u);
  const auto& f = receiver_events.downloads_failed[0];
  EXPECT_EQ(f.error, TransferError::TIMEOUT);
  EXPECT_NE(f.reason.find("no response from the server"), std::string::npos);
  EXPECT_EQ(f.desc->sent_bytes.load(), 10000u);
  EXPECT_EQ(f.desc->state.load(), TransferState::FAILED);
  EXPECT_EQ(receiver->active_downloads(), 0u);
  // Partial output is kept by default.
  EXPECT_EQ(std::filesystem::file_size(received("gap.bin")), 10000u);
}

TEST_F(TransferEngineTest, PartialOutputRemovedWhenConfigured) {
  auto ropts = fast_options(recv_dir);
  ropts.remove_partial_on_failure = true;
  make_engines(fast_options(tmp.file("unused")), ropts);
  std::string src = source_file("gap.bin", 30000);
  hub.drop_chunk_steps.insert(2);

  ASSERT_NE(sender->send_file(src, RECEIVER), nullptr);
  run();

  ASSERT_EQ(receiver_events.downloads_failed.size(), 1u);
  EXPECT_FALSE(std::filesystem::exists(received("gap.bin")));
}

TEST_F(TransferEngineTest, ConcurrentUploadsToOnePeerGetDistinctIds) {
  make_engines();
  std::string a = source_file("a.bin", 12000);
  std::string b = source_file("b.bin", 3000);
  std::string c = source_file("c.bin", 21000);

  auto da = sender->send_file(a, RECEIVER);
  auto db = sender->send_file(b, RECEIVER);
  auto dc = sender->send_file(c, RECEIVER);
  ASSERT_TRUE(da && db && dc);

  std::set<TransferId> ids{da->id, db->id, dc->id};
  EXPECT_EQ(ids.size(), 3u);
  EXPECT_EQ(sender->active_uploads(), 3u);
  run();

  EXPECT_EQ(sender_events.uploads_ok.size(), 3u);
  EXPECT_EQ(receiver_events.downloads_ok.size(), 3u);
  EXPECT_EQ(test::read_file(received("a.bin")), test::read_file(a));
  EXPECT_EQ(test::read_file(received("b.bin")), test::read_file(b));
  EXPECT_EQ(test::read_file(received("c.bin")), test::read_file(c));
}

TEST_F(TransferEngineTest, SameFileNameFromTwoUploadsGetsSeparateOutputs) {
  make_engines();
  std::filesystem::create_directories(tmp.file("d1"));
  std::filesystem::create_directories(tmp.file("d2"));
  std::string a = source_file("d1/x.bin", 30000);
  std::string b = source_file("d2/x.bin", 20000);

  ASSERT_NE(sender->send_file(a, RECEIVER), nullptr);
  ASSERT_NE(sender->send_file(b, RECEIVER), nullptr);
  run();

  ASSERT_EQ(receiver_events.downloads_ok.size(), 2u);
  EXPECT_TRUE(receiver_events.downloads_failed.empty());

  std::set<std::string> paths{receiver_events.downloads_ok[0]->path, receiver_events.downloads_ok[1]->path};
  EXPECT_EQ(paths, (std::set<std::string>{received("x.bin"), received("x (1).bin")}));
  for (const auto& d : receiver_events.downloads_ok) {
    EXPECT_EQ(test::read_file(d->path), test::read_file(d->total_bytes == 30000 ? a : b));
    EXPECT_FALSE(receiver->store().is_reserved(d->path));
  }
}

TEST_F(TransferEngineTest, FinishedDownloadFreesItsFileName) {
  make_engines();
  std::string src = source_file("again.bin", 15000);

  ASSERT_NE(sender->send_file(src, RECEIVER), nullptr);
  run();
  io.restart();
  ASSERT_NE(sender->send_file(src, RECEIVER), nullptr);
  run();

  ASSERT_EQ(receiver_events.downloads_ok.size(), 2u);
  EXPECT_EQ(receiver_events.downloads_ok[0]->path, received("again.bin"));
  EXPECT_EQ(receiver_events.downloads_ok[1]->path, received("again.bin"));
  EXPECT_FALSE(std::filesystem::exists(received("again (1).bin")));
}

TEST_F(TransferEngineTest, ExhaustedIdsFailUploadThroughEvent) {
  make_engines();
  for (uint32_t id = 0; id < TransferRegistry::ID_RANDOM_RANGE; id++) {
    auto d = std::make_shared<TransferDescriptor>();
    d->direction = TransferDirection::UPLOAD;
    d->sender_peer = SENDER;
    d->receiver_peer = RECEIVER;
    d->id = static_cast<TransferId>(id);
    ASSERT_TRUE(sender_registry.add(Collection::UPLOADS, d));
  }
  std::string src = source_file("one-too-many.bin", 100);

  DescriptorPtr desc;
  EXPECT_NO_THROW(desc = sender->send_file(src, RECEIVER));
  EXPECT_EQ(desc, nullptr);
  run();

  ASSERT_EQ(sender_events.uploads_failed.size(), 1u);
  EXPECT_EQ(sender_events.uploads_failed[0].error, TransferError::ID_EXHAUSTED);
  EXPECT_EQ(sender_events.uploads_failed[0].desc->state.load(), TransferState::FAILED);
  EXPECT_TRUE(sender_events.uploads_ok.empty());
  EXPECT_TRUE(hub.sent.empty());
  EXPECT_EQ(sender->active_uploads(), static_cast<size_t>(TransferRegistry::ID_RANDOM_RANGE));
}

TEST_F(TransferEngineTest, ChunkForUnknownTransferIsDropped) {
  make_engines();

  protocol::ChunkMsg stray;
  stray.sender_peer = SENDER;
  stray.transfer_id = 99;
  stray.step = 0;
  stray.data = {1, 2, 3};
  receiver->handle(stray.to_message());

  protocol::Message garbage{MsgType::TRANSFER_SETUP, {0, 9}};
  receiver->handle(garbage);
  run();

  EXPECT_TRUE(receiver_events.downloads_failed.empty());
  EXPECT_TRUE(receiver_events.downloads_started.empty());
  EXPECT_EQ(receiver->active_downloads(), 0u);
  EXPECT_TRUE(hub.sent.empty());
}

TEST_F(TransferEngineTest, CancelDownloadReleasesTransfer) {
  auto ropts = fast_options(recv_dir);
  ropts.client_timeout_seconds = 5.0;
  make_engines(fast_options(tmp.file("unused")), ropts);
  std::string src = source_file("cancel.bin", 40000);
  hub.hold_chunks = true;

  TransferEvents ev = receiver_events.events();
  ev.on_download_started = [this](const DescriptorPtr& d) {
    receiver_events.downloads_started.push_back(d);
    EXPECT_TRUE(receiver->cancel_download(d->sender_peer, d->id));
  };
  receiver->set_events(ev);

  ASSERT_NE(sender->send_file(src, RECEIVER), nullptr);
  run();

  ASSERT_EQ(receiver_events.downloads_failed.size(), 1u);
  EXPECT_EQ(receiver_events.downloads_failed[0].error, TransferError::CANCELLED);
  EXPECT_EQ(receiver_events.downloads_failed[0].desc->state.load(), TransferState::CANCELLED);
  EXPECT_TRUE(receiver_events.downloads_ok.empty());
  EXPECT_EQ(receiver->active_downloads(), 0u);
  EXPECT_FALSE(receiver->cancel_download(SENDER, 1));
}

TEST_F(TransferEngineTest, CancelUploadWhileAwaitingReady) {
  auto sopts = fast_options(tmp.file("unused"));
  sopts.server_timeout_seconds = 5.0;
  make_engines(sopts, fast_options(recv_dir));
  std::string src = source_file("abort.bin", 20000);
  hub.drop_ready = true;

  auto desc = sender->send_file(src, RECEIVER);
  ASSERT_NE(desc, nullptr);
  EXPECT_TRUE(sender->cancel_upload(RECEIVER, desc->id));

  auto start = std::chrono::steady_clock::now();
  run();

  ASSERT_EQ(sender_events.uploads_failed.size(), 1u);
  EXPECT_EQ(sender_events.uploads_failed[0].error, TransferError::CANCELLED);
  EXPECT_EQ(hub.count(MsgType::TRANSFER_CHUNK), 0u);
  EXPECT_EQ(sender->active_uploads(), 0u);
  EXPECT_EQ(desc->state.load(), TransferState::CANCELLED);
  // The receiver still waits for chunks until its own timeout.
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST_F(TransferEngineTest, PacingSpacesChunks) {
  auto sopts = fast_options(tmp.file("unused"));
  sopts.bytes_per_chunk = 1000;
  sopts.chunks_per_second = 20;
  auto ropts = fast_options(recv_dir);
  ropts.client_timeout_seconds = 2.0;
  make_engines(sopts, ropts);
  std::string src = source_file("paced.bin", 5000);

  auto start = std::chrono::steady_clock::now();
  ASSERT_NE(sender->send_file(src, RECEIVER), nullptr);
  run();
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_EQ(sender_events.uploads_ok.size(), 1u);
  EXPECT_EQ(hub.count(MsgType::TRANSFER_CHUNK), 5u);
  // Four gaps of 50 ms between five chunks.
  EXPECT_GE(elapsed, std::chrono::milliseconds(195));
  EXPECT_EQ(test::read_file(received("paced.bin")), test::read_file(src));
}

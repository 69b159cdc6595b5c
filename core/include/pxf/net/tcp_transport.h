#pragma once

#include <boost/asio.hpp>
#include <functional>
#include "pxf/net/peer_directory.h"
#include "pxf/net/session_manager.h"
#include "pxf/net/tcp_server.h"
#include "pxf/net/transport.h"

namespace pxf::net {

// Transport over framed TCP connections. Listens on `port` and opens one
// outbound connection per target peer on first use, resolving its address
// through the peer directory. Must be driven by a single-threaded io_context.
class TcpTransport : public Transport {
public:
  using MessageHandler = TcpSession::MessageHandler;

  TcpTransport(boost::asio::io_context& io, PeerId local, uint16_t port,
               const PeerDirectory& peers);

  // Receives every inbound message; set before start().
  void set_message_handler(MessageHandler h) { on_message_ = std::move(h); }

  void start();
  void stop();

  // Calls done once every outbound frame has been written (or dropped).
  void when_flushed(std::function<void()> done);

  PeerId local_peer() const override { return local_; }
  void send(PeerId target, const protocol::Message& msg) override;

  uint16_t port() const { return server_.port(); }
  size_t sessions() const { return sessions_.count(); }

private:
  std::shared_ptr<TcpSession> session_for(PeerId target);
  void poll_flushed(std::shared_ptr<boost::asio::steady_timer> timer, std::function<void()> done);

  boost::asio::io_context& io_;
  PeerId local_;
  const PeerDirectory& peers_;
  MessageHandler on_message_;
  SessionManager sessions_;
  TcpServer server_;
};

} // namespace pxf::net

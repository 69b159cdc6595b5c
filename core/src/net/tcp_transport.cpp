#include "pxf/net/tcp_transport.h"
#include "pxf/log/logger.h"

namespace pxf::net {

TcpTransport::TcpTransport(boost::asio::io_context& io, PeerId local, uint16_t port,
                           const PeerDirectory& peers)
  : io_(io),
    local_(local),
    peers_(peers),
    server_(io, port, sessions_, [this](const protocol::Message& msg) {
      if (on_message_) on_message_(msg);
    }) {}

void TcpTransport::start() {
  server_.start();
}

void TcpTransport::stop() {
  server_.stop();
  sessions_.close_all();
}

void TcpTransport::send(PeerId target, const protocol::Message& msg) {
  boost::asio::post(io_, [this, target, msg]() {
    auto session = session_for(target);
    if (!session) return;
    session->send(msg);
  });
}

void TcpTransport::when_flushed(std::function<void()> done) {
  // Sends are posted, so queue the check behind them.
  boost::asio::post(io_, [this, done = std::move(done)]() mutable {
    poll_flushed(std::make_shared<boost::asio::steady_timer>(io_), std::move(done));
  });
}

void TcpTransport::poll_flushed(std::shared_ptr<boost::asio::steady_timer> timer, std::function<void()> done) {
  if (sessions_.queued() == 0) {
    done();
    return;
  }
  timer->expires_after(std::chrono::milliseconds(50));
  timer->async_wait([this, timer, done = std::move(done)](const boost::system::error_code& ec) mutable {
    if (ec) return;
    poll_flushed(timer, std::move(done));
  });
}

std::shared_ptr<TcpSession> TcpTransport::session_for(PeerId target) {
  if (auto existing = sessions_.outbound(target)) {
    return existing;
  }

  auto peer = peers_.resolve(target);
  if (!peer) {
    Logger::instance().warn("transport: dropping message for unknown peer " + std::to_string(target));
    return nullptr;
  }

  auto session = std::make_shared<TcpSession>(boost::asio::ip::tcp::socket(io_),
    [this](const protocol::Message& msg) {
      if (on_message_) on_message_(msg);
    });
  session->set_close_handler([this](const std::shared_ptr<TcpSession>& closed) {
    sessions_.remove_session(closed);
  });
  sessions_.set_outbound(target, session);
  session->connect(peer->host, peer->port);

  Logger::instance().info("transport: connecting to peer " + std::to_string(target) +
                          " at " + peer->host + ":" + std::to_string(peer->port));
  return session;
}

} // namespace pxf::net

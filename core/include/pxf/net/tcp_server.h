#pragma once
#include <boost/asio.hpp>
#include "pxf/net/session_manager.h"
#include "pxf/net/tcp_session.h"

namespace pxf::net {

class TcpServer {
public:
  TcpServer(boost::asio::io_context& io, uint16_t port,
            SessionManager& sessions, TcpSession::MessageHandler on_message);
  void start();
  void stop();

  uint16_t port() const;

private:
  void do_accept();

  boost::asio::ip::tcp::acceptor acceptor_;
  SessionManager& sessions_;
  TcpSession::MessageHandler on_message_;
};

} // namespace pxf::net

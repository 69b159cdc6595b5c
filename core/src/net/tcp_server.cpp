#include "pxf/net/tcp_server.h"
#include <iostream>

namespace pxf::net {

TcpServer::TcpServer(boost::asio::io_context& io, uint16_t port,
                     SessionManager& sessions, TcpSession::MessageHandler on_message)
  : acceptor_(io, boost::asio::ip::tcp::endpoint(boost::asio::ip::tcp::v4(), port)),
    sessions_(sessions),
    on_message_(std::move(on_message)) {}

void TcpServer::start() {
  std::cout << "[core] listening on 0.0.0.0:" << acceptor_.local_endpoint().port() << "\n";
  do_accept();
}

void TcpServer::stop() {
  boost::system::error_code ignored;
  acceptor_.close(ignored);
}

uint16_t TcpServer::port() const {
  return acceptor_.local_endpoint().port();
}

void TcpServer::do_accept() {
  acceptor_.async_accept([this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (!ec) {
      auto s = std::make_shared<TcpSession>(std::move(socket), on_message_);
      s->set_close_handler([this](const std::shared_ptr<TcpSession>& closed) {
        sessions_.remove_session(closed);
      });
      sessions_.add_inbound(s);
      s->start();
    } else {
      std::cout << "[core] accept error: " << ec.message() << "\n";
    }
    do_accept();
  });
}

} // namespace pxf::net

#include "pxf/net/tcp_session.h"
#include <chrono>
#include <cstring>
#include <iostream>
#include <sstream>

namespace pxf::net {

static std::string now_ts() {
  using namespace std::chrono;
  auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  return std::to_string(ms);
}

TcpSession::TcpSession(boost::asio::ip::tcp::socket socket, MessageHandler on_message)
  : socket_(std::move(socket)),
    resolver_(socket_.get_executor()),
    on_message_(std::move(on_message)) {}

void TcpSession::log(const std::string& s) {
  std::cout << "[sess " << now_ts() << " " << label_ << "] " << s << "\n";
  std::cout.flush();
}

void TcpSession::start() {
  boost::system::error_code ec;
  auto ep = socket_.remote_endpoint(ec);
  if (!ec) {
    std::ostringstream oss;
    oss << ep.address().to_string() << ":" << ep.port();
    label_ = oss.str();
  }
  log("CONNECTED (inbound)");
  connected_ = true;
  do_read_header();
}

void TcpSession::connect(const std::string& host, uint16_t port) {
  label_ = host + ":" + std::to_string(port);
  auto self = shared_from_this();
  resolver_.async_resolve(host, std::to_string(port),
    [this, self](boost::system::error_code ec, boost::asio::ip::tcp::resolver::results_type results) {
      if (ec) {
        handle_closed("resolve: " + ec.message());
        return;
      }
      boost::asio::async_connect(socket_, results,
        [this, self](boost::system::error_code ec, const boost::asio::ip::tcp::endpoint&) {
          if (ec) {
            handle_closed("connect: " + ec.message());
            return;
          }
          log("CONNECTED (outbound)");
          connected_ = true;
          do_read_header();
          if (!outq_.empty()) do_write();
        });
    });
}

void TcpSession::do_read_header() {
  auto self = shared_from_this();
  boost::asio::async_read(socket_,
    boost::asio::buffer(&header_, sizeof(header_)),
    [this, self](boost::system::error_code ec, std::size_t n) {
      if (ec) {
        handle_closed("read header: " + ec.message());
        return;
      }
      if (n != sizeof(header_)) {
        handle_closed("header size mismatch");
        return;
      }

      try {
        protocol::validate_header(header_);
      } catch (const std::exception& e) {
        handle_closed(std::string("bad header: ") + e.what());
        return;
      }

      body_.assign(protocol::payload_len(header_), 0);
      do_read_body();
    }
  );
}

void TcpSession::do_read_body() {
  auto self = shared_from_this();
  if (body_.empty()) {
    on_message_(protocol::Message{static_cast<protocol::MsgType>(header_.type), body_});
    do_read_header();
    return;
  }

  boost::asio::async_read(socket_,
    boost::asio::buffer(body_.data(), body_.size()),
    [this, self](boost::system::error_code ec, std::size_t n) {
      if (ec) {
        handle_closed("read body: " + ec.message());
        return;
      }
      if (n != body_.size()) {
        handle_closed("body size mismatch");
        return;
      }

      on_message_(protocol::Message{static_cast<protocol::MsgType>(header_.type), std::move(body_)});
      body_.clear();
      do_read_header();
    }
  );
}

void TcpSession::send(const protocol::Message& msg) {
  if (closed_) return;

  // frame = header(12) + payload
  protocol::MessageHeaderWire h = protocol::make_header(msg.type, static_cast<uint32_t>(msg.payload.size()));

  OutFrame f;
  f.bytes.resize(sizeof(h) + msg.payload.size());
  std::memcpy(f.bytes.data(), &h, sizeof(h));
  if (!msg.payload.empty()) std::memcpy(f.bytes.data() + sizeof(h), msg.payload.data(), msg.payload.size());

  bool writing = !outq_.empty();
  outq_.push_back(std::move(f));
  if (connected_ && !writing) do_write();
}

void TcpSession::do_write() {
  auto self = shared_from_this();
  boost::asio::async_write(socket_,
    boost::asio::buffer(outq_.front().bytes),
    [this, self](boost::system::error_code ec, std::size_t) {
      if (ec) {
        handle_closed("write: " + ec.message());
        return;
      }
      outq_.pop_front();
      if (!outq_.empty()) do_write();
    }
  );
}

void TcpSession::close() {
  if (closed_) return;
  resolver_.cancel();
  boost::system::error_code ignored;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
}

void TcpSession::handle_closed(const std::string& why) {
  if (closed_) return;
  closed_ = true;
  log("DISCONNECTED (" + why + ")");
  if (!outq_.empty()) {
    log("dropping " + std::to_string(outq_.size()) + " queued frames");
  }
  boost::system::error_code ignored;
  socket_.close(ignored);
  if (on_close_) on_close_(shared_from_this());
}

} // namespace pxf::net

#pragma once
#include <boost/asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "pxf/protocol/message.h"

namespace pxf::net {

// One framed TCP connection. Accepted sessions start reading right away;
// outbound sessions queue frames until connect() completes.
class TcpSession : public std::enable_shared_from_this<TcpSession> {
public:
  using MessageHandler = std::function<void(const protocol::Message&)>;
  using CloseHandler = std::function<void(const std::shared_ptr<TcpSession>&)>;

  TcpSession(boost::asio::ip::tcp::socket socket, MessageHandler on_message);

  void set_close_handler(CloseHandler h) { on_close_ = std::move(h); }

  // Accepted side
  void start();

  // Outbound side
  void connect(const std::string& host, uint16_t port);

  void send(const protocol::Message& msg);
  void close();

  bool is_closed() const { return closed_; }
  size_t queued() const { return outq_.size(); }

private:
  void log(const std::string& s);

  void do_read_header();
  void do_read_body();
  void do_write();
  void handle_closed(const std::string& why);

  boost::asio::ip::tcp::socket socket_;
  boost::asio::ip::tcp::resolver resolver_;
  MessageHandler on_message_;
  CloseHandler on_close_;
  std::string label_ = "?";

  protocol::MessageHeaderWire header_{};
  std::vector<uint8_t> body_;

  struct OutFrame {
    std::vector<uint8_t> bytes;
  };
  std::deque<OutFrame> outq_;
  bool connected_ = false;
  bool closed_ = false;
};

} // namespace pxf::net

#pragma once

#include "pxf/common/types.h"
#include "pxf/net/tcp_session.h"
#include <memory>
#include <unordered_map>
#include <vector>
#include <mutex>

namespace pxf::net {

// Tracks the live sessions of one transport: at most one outbound session
// per peer, plus every accepted inbound session.
class SessionManager {
 public:
  void add_inbound(std::shared_ptr<TcpSession> session);
  void set_outbound(PeerId peer, std::shared_ptr<TcpSession> session);

  // nullptr if there is none or it has closed
  std::shared_ptr<TcpSession> outbound(PeerId peer) const;

  void remove_session(const std::shared_ptr<TcpSession>& session);
  void close_all();

  size_t count() const;

  // Frames waiting in outbound session write queues
  size_t queued() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<PeerId, std::shared_ptr<TcpSession>> outbound_;
  mutable std::vector<std::weak_ptr<TcpSession>> inbound_;
};

} // namespace pxf::net

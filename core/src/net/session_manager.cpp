#include "pxf/net/session_manager.h"
#include <algorithm>

namespace pxf::net {

void SessionManager::add_inbound(std::shared_ptr<TcpSession> session) {
  std::lock_guard<std::mutex> lock(mutex_);
  inbound_.push_back(session);
}

void SessionManager::set_outbound(PeerId peer, std::shared_ptr<TcpSession> session) {
  std::lock_guard<std::mutex> lock(mutex_);
  outbound_[peer] = std::move(session);
}

std::shared_ptr<TcpSession> SessionManager::outbound(PeerId peer) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = outbound_.find(peer);
  if (it == outbound_.end() || it->second->is_closed()) {
    return nullptr;
  }
  return it->second;
}

void SessionManager::remove_session(const std::shared_ptr<TcpSession>& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = outbound_.begin(); it != outbound_.end();) {
    if (it->second == session) {
      it = outbound_.erase(it);
    } else {
      ++it;
    }
  }
  inbound_.erase(std::remove_if(inbound_.begin(), inbound_.end(),
                                [&](const std::weak_ptr<TcpSession>& w) {
                                  auto s = w.lock();
                                  // Clean up expired weak_ptr too
                                  return !s || s == session;
                                }),
                 inbound_.end());
}

void SessionManager::close_all() {
  std::vector<std::shared_ptr<TcpSession>> all;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& pair : outbound_) all.push_back(pair.second);
    for (auto& w : inbound_) {
      if (auto s = w.lock()) all.push_back(s);
    }
    outbound_.clear();
    inbound_.clear();
  }
  // close() may run close handlers that call back into remove_session
  for (auto& s : all) s->close();
}

size_t SessionManager::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t cnt = outbound_.size();
  for (auto it = inbound_.begin(); it != inbound_.end();) {
    if (it->lock()) {
      cnt++;
      ++it;
    } else {
      it = inbound_.erase(it);
    }
  }
  return cnt;
}

size_t SessionManager::queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t n = 0;
  for (const auto& pair : outbound_) n += pair.second->queued();
  return n;
}

} // namespace pxf::net

#include "pxf/net/peer_directory.h"
#include <sstream>
#include <stdexcept>

namespace pxf::net {

void StaticPeerDirectory::load(const std::string& list) {
  std::stringstream ss(list);
  std::string entry;
  while (std::getline(ss, entry, ',')) {
    if (entry.empty()) continue;

    auto eq = entry.find('=');
    auto colon = entry.rfind(':');
    if (eq == std::string::npos || colon == std::string::npos || colon < eq) {
      throw std::runtime_error("bad peer entry: " + entry);
    }

    Peer p;
    try {
      unsigned long id = std::stoul(entry.substr(0, eq));
      unsigned long port = std::stoul(entry.substr(colon + 1));
      if (port == 0 || port > 0xFFFF) throw std::out_of_range("port");
      p.id = static_cast<PeerId>(id);
      p.port = static_cast<uint16_t>(port);
    } catch (const std::logic_error&) {
      throw std::runtime_error("bad peer entry: " + entry);
    }
    p.host = entry.substr(eq + 1, colon - eq - 1);
    if (p.host.empty()) throw std::runtime_error("bad peer entry: " + entry);

    add(p);
  }
}

void StaticPeerDirectory::add(const Peer& peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  peers_[peer.id] = peer;
}

bool StaticPeerDirectory::remove(PeerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.erase(id) > 0;
}

size_t StaticPeerDirectory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

std::optional<Peer> StaticPeerDirectory::resolve(PeerId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it != peers_.end()) {
    return it->second;
  }
  return std::nullopt;
}

} // namespace pxf::net

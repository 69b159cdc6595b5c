#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "pxf/common/types.h"

namespace pxf::net {

struct Peer {
  PeerId id = 0;
  std::string host;
  uint16_t port = 0;
};

class PeerDirectory {
public:
  virtual ~PeerDirectory() = default;
  virtual std::optional<Peer> resolve(PeerId id) const = 0;
};

// Fixed table of known peers, typically loaded from PXF_PEERS.
class StaticPeerDirectory : public PeerDirectory {
public:
  StaticPeerDirectory() = default;

  // Adds every entry of "id=host:port,id=host:port".
  // Throws std::runtime_error on a malformed entry; earlier entries stay added.
  void load(const std::string& list);

  void add(const Peer& peer);
  bool remove(PeerId id);
  size_t size() const;

  std::optional<Peer> resolve(PeerId id) const override;

private:
  mutable std::mutex mutex_;
  std::map<PeerId, Peer> peers_;
};

} // namespace pxf::net

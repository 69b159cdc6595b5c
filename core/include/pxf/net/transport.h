#pragma once

#include "pxf/common/types.h"
#include "pxf/protocol/message.h"

namespace pxf::net {

// Peer-addressed, at-most-once, unordered message delivery.
class Transport {
public:
  virtual ~Transport() = default;

  virtual PeerId local_peer() const = 0;

  // Fire and forget: undeliverable messages are dropped by the implementation.
  virtual void send(PeerId target, const protocol::Message& msg) = 0;
};

} // namespace pxf::net

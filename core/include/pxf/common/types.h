#pragma once
#include <cstdint>

namespace pxf {

// Opaque network endpoint identifier handed out by the transport layer.
using PeerId = uint32_t;

// Unique only among the active transfers of one sender/receiver pair.
using TransferId = uint16_t;

} // namespace pxf

#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace actorkit {

// Opaque parameter/result payloads. Encoding is owned by handlers and their
// callers; nothing in actorkit looks inside.
using Bytes = std::vector<uint8_t>;
using ByteView = std::span<const uint8_t>;

}  // namespace actorkit

#pragma once

// Method number space shared by every actor.
//
//   0                  send (no-op, value transfer only)
//   1                  constructor
//   [2, 2^24)          reserved for future standardized methods
//   [2^24, 2^64)       hash-derived selectors
//
// These values and Normalize() are part of the wire contract: two
// implementations computing the selector for the same name must agree bit
// for bit, so none of this is configurable.

#include <algorithm>
#include <array>
#include <cstdint>

namespace actorkit::dispatch {

using MethodNumber = uint64_t;

inline constexpr MethodNumber kMethodSend = 0;
inline constexpr MethodNumber kMethodConstructor = 1;
inline constexpr MethodNumber kFirstAvailable = MethodNumber{1} << 24;

// Selectors below kFirstAvailable that may be registered explicitly.
inline constexpr std::array<MethodNumber, 2> kPermittedReserved = {
    kMethodSend, kMethodConstructor};

// Maps a hash candidate into the hash-derived space. Candidates already at
// or above kFirstAvailable are returned unchanged.
constexpr auto Normalize(uint64_t candidate) -> MethodNumber {
  if (candidate >= kFirstAvailable) {
    return candidate;
  }
  return candidate + kFirstAvailable;
}

constexpr auto IsReserved(MethodNumber number) -> bool {
  return number < kFirstAvailable;
}

constexpr auto IsPermittedExplicit(MethodNumber number) -> bool {
  if (!IsReserved(number)) {
    return true;
  }
  return std::ranges::find(kPermittedReserved, number) !=
         kPermittedReserved.end();
}

}  // namespace actorkit::dispatch

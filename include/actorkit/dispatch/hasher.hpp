#pragma once

#include <cstddef>
#include <string_view>

#include "actorkit/common/bytes.hpp"

namespace actorkit::dispatch {

// Digest function over a method name's UTF-8 bytes. Implementations must be
// pure: the same name always yields the same digest, in any process.
class Hasher {
 public:
  Hasher() = default;
  virtual ~Hasher() = default;

  Hasher(const Hasher&) = default;
  auto operator=(const Hasher&) -> Hasher& = default;
  Hasher(Hasher&&) = default;
  auto operator=(Hasher&&) -> Hasher& = default;

  [[nodiscard]] virtual auto Digest(std::string_view name) const -> Bytes = 0;
};

// BLAKE2b-512 via OpenSSL.
class Blake2bHasher final : public Hasher {
 public:
  static constexpr size_t kDigestSize = 64;

  [[nodiscard]] auto Digest(std::string_view name) const -> Bytes override;
};

}  // namespace actorkit::dispatch

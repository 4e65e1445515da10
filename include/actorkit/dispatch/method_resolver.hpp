#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "actorkit/common/bytes.hpp"
#include "actorkit/dispatch/errors.hpp"
#include "actorkit/dispatch/hasher.hpp"
#include "actorkit/dispatch/method_number.hpp"

namespace actorkit::dispatch {

// Number of leading digest bytes read (big-endian) as the hash candidate.
inline constexpr size_t kCandidatePrefixBytes = 4;

struct ResolverOptions {
  // Require names to start with an ASCII uppercase letter and contain only
  // [A-Za-z0-9_].
  bool strict_names = false;
};

// Reads the candidate prefix of a digest. Throws InternalError when the
// digest is shorter than kCandidatePrefixBytes.
auto CandidateFromDigest(ByteView digest) -> uint64_t;

// Returns the first naming rule the name breaks, or an empty string.
auto CheckStrictName(std::string_view name) -> std::string;

// Converts a function identifier to the PascalCase method name hashed for
// it: "transfer_from" -> "TransferFrom", "getURL" -> "GetUrl",
// "TOTAL_SUPPLY" -> "TotalSupply". Each word keeps only its first letter
// uppercase.
auto ToPascalCase(std::string_view identifier) -> std::string;

// Computes selectors for method names: Hasher, then Normalize().
class MethodResolver {
 public:
  MethodResolver();
  explicit MethodResolver(
      std::shared_ptr<const Hasher> hasher, ResolverOptions options = {});

  [[nodiscard]] auto Resolve(std::string_view name) const
      -> std::expected<MethodNumber, BuildError>;

  [[nodiscard]] auto Options() const -> const ResolverOptions& {
    return options_;
  }

 private:
  std::shared_ptr<const Hasher> hasher_;
  ResolverOptions options_;
};

}  // namespace actorkit::dispatch

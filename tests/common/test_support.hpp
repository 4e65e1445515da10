#pragma once

#include <atomic>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"
#include "actorkit/common/bytes.hpp"
#include "actorkit/dispatch/hasher.hpp"
#include "actorkit/dispatch/method_resolver.hpp"
#include "actorkit/dispatch/method_table.hpp"

namespace actorkit::test {

// Returns canned digests for selected names and BLAKE2b for the rest, so
// tests can force two names onto one selector.
class StubHasher final : public dispatch::Hasher {
 public:
  explicit StubHasher(absl::flat_hash_map<std::string, Bytes> digests)
      : digests_(std::move(digests)) {
  }

  [[nodiscard]] auto Digest(std::string_view name) const -> Bytes override {
    if (auto it = digests_.find(absl::string_view(name.data(), name.size())); it != digests_.end()) {
      return it->second;
    }
    return fallback_.Digest(name);
  }

 private:
  absl::flat_hash_map<std::string, Bytes> digests_;
  dispatch::Blake2bHasher fallback_;
};

inline auto MakeStubResolver(
    absl::flat_hash_map<std::string, Bytes> digests,
    dispatch::ResolverOptions options = {}) -> dispatch::MethodResolver {
  return dispatch::MethodResolver(
      std::make_shared<StubHasher>(std::move(digests)), options);
}

// Hands out handlers that share one invocation counter.
class CallCounter {
 public:
  // Handler that returns `reply`.
  [[nodiscard]] auto Returning(Bytes reply) const -> dispatch::Handler {
    return [calls = calls_, reply = std::move(reply)](
               ByteView) -> dispatch::HandlerResult {
      ++*calls;
      return reply;
    };
  }

  // Handler that reports failure with `payload`.
  [[nodiscard]] auto Failing(Bytes payload) const -> dispatch::Handler {
    return [calls = calls_, payload = std::move(payload)](
               ByteView) -> dispatch::HandlerResult {
      ++*calls;
      return std::unexpected(dispatch::HandlerFailed{.payload = payload});
    };
  }

  // Handler that returns its parameters.
  [[nodiscard]] auto Echo() const -> dispatch::Handler {
    return [calls = calls_](ByteView params) -> dispatch::HandlerResult {
      ++*calls;
      return Bytes(params.begin(), params.end());
    };
  }

  [[nodiscard]] auto Count() const -> int {
    return calls_->load();
  }

 private:
  std::shared_ptr<std::atomic<int>> calls_ =
      std::make_shared<std::atomic<int>>(0);
};

}  // namespace actorkit::test

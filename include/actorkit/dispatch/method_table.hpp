#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "actorkit/common/bytes.hpp"
#include "actorkit/dispatch/errors.hpp"
#include "actorkit/dispatch/method_number.hpp"

namespace actorkit::dispatch {

using HandlerResult = std::expected<Bytes, HandlerFailed>;

// Receives the raw parameter bytes of a call. Thread safety of the handler
// body is the handler's own concern.
using Handler = std::function<HandlerResult(ByteView params)>;

struct MethodEntry {
  MethodNumber selector;
  Handler handler;
};

// Immutable selector -> handler table. Only MethodRegistry can populate one;
// once handed out it exposes lookups only, so any number of threads may read
// it concurrently.
class MethodTable final {
 public:
  ~MethodTable() = default;

  MethodTable(const MethodTable&) = delete;
  auto operator=(const MethodTable&) -> MethodTable& = delete;

  MethodTable(MethodTable&&) = default;
  auto operator=(MethodTable&&) -> MethodTable& = default;

  // Returns nullptr when no entry matches.
  [[nodiscard]] auto Find(MethodNumber selector) const -> const MethodEntry*;

  [[nodiscard]] auto Contains(MethodNumber selector) const -> bool {
    return entries_.contains(selector);
  }

  [[nodiscard]] auto Size() const -> size_t {
    return entries_.size();
  }

  [[nodiscard]] auto Empty() const -> bool {
    return entries_.empty();
  }

  // All registered selectors, ascending.
  [[nodiscard]] auto Selectors() const -> std::vector<MethodNumber>;

 private:
  friend class MethodRegistry;

  MethodTable() = default;

  absl::flat_hash_map<MethodNumber, MethodEntry> entries_;
};

}  // namespace actorkit::dispatch

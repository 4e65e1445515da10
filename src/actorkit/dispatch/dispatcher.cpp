#include "actorkit/dispatch/dispatcher.hpp"

#include <expected>
#include <utility>

#include <spdlog/spdlog.h>

namespace actorkit::dispatch {

auto Dispatch(const MethodTable& table, MethodNumber selector, ByteView params)
    -> DispatchResult {
  const MethodEntry* entry = table.Find(selector);
  if (entry == nullptr) {
    spdlog::debug("dispatch: no method {}", selector);
    return std::unexpected(MethodNotFound{.selector = selector});
  }

  HandlerResult result = entry->handler(params);
  if (!result) {
    return std::unexpected(std::move(result.error()));
  }
  return std::move(*result);
}

}  // namespace actorkit::dispatch

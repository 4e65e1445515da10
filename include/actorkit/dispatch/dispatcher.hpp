#pragma once

#include <expected>

#include "actorkit/common/bytes.hpp"
#include "actorkit/dispatch/errors.hpp"
#include "actorkit/dispatch/method_number.hpp"
#include "actorkit/dispatch/method_table.hpp"

namespace actorkit::dispatch {

using DispatchResult = std::expected<Bytes, DispatchError>;

// Routes one call to the handler bound to `selector`.
//
// A miss returns MethodNotFound without running anything. A hit runs the
// handler exactly once and forwards its success bytes or HandlerFailed
// payload as-is; exceptions thrown by the handler propagate to the caller.
// Holds no state, so concurrent calls against one table are safe.
auto Dispatch(const MethodTable& table, MethodNumber selector, ByteView params)
    -> DispatchResult;

}  // namespace actorkit::dispatch

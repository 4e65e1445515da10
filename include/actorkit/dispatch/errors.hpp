#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <variant>
#include <vector>

#include "actorkit/common/bytes.hpp"
#include "actorkit/dispatch/method_number.hpp"

namespace actorkit::dispatch {

// =============================================================================
// Build-time errors. Every one of these is fatal to deployment.
// =============================================================================

struct EmptyMethodName {
  auto operator==(const EmptyMethodName&) const -> bool = default;
};

// Only produced when strict naming is enabled.
struct IllegalMethodName {
  std::string name;
  std::string reason;

  auto operator==(const IllegalMethodName&) const -> bool = default;
};

// Explicit selector below kFirstAvailable outside kPermittedReserved.
struct ReservedNumberMisuse {
  MethodNumber attempted;

  auto operator==(const ReservedNumberMisuse&) const -> bool = default;
};

// Names are listed in registration order. Explicit entries without a label
// appear as "#<number>".
struct DuplicateSelector {
  std::vector<std::string> names;
  MethodNumber selector;

  auto operator==(const DuplicateSelector&) const -> bool = default;
};

struct MissingHandler {
  std::string label;

  auto operator==(const MissingHandler&) const -> bool = default;
};

using BuildError = std::variant<
    EmptyMethodName, IllegalMethodName, ReservedNumberMisuse,
    DuplicateSelector, MissingHandler>;

// =============================================================================
// Dispatch-time errors. Ordinary outcomes reported to the caller.
// =============================================================================

struct MethodNotFound {
  MethodNumber selector;

  auto operator==(const MethodNotFound&) const -> bool = default;
};

// Reported by a handler. The payload is opaque and forwarded untouched.
struct HandlerFailed {
  Bytes payload;

  auto operator==(const HandlerFailed&) const -> bool = default;
};

using DispatchError = std::variant<MethodNotFound, HandlerFailed>;

auto ToString(const BuildError& error) -> std::string;
auto ToString(const DispatchError& error) -> std::string;

// Exception wrapper for BuildError, for deployment paths that fail fast.
class BuildErrorException final : public std::exception {
 public:
  explicit BuildErrorException(BuildError error);

  [[nodiscard]] auto GetError() const -> const BuildError& {
    return error_;
  }

  [[nodiscard]] auto what() const noexcept -> const char* override {
    return message_.c_str();
  }

 private:
  BuildError error_;
  std::string message_;
};

}  // namespace actorkit::dispatch

#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace actorkit::common {

// Exception type for internal actorkit errors (library bugs or a broken
// collaborator such as a Hasher implementation, not deployment errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format("Internal error in {}: {}", context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace actorkit::common

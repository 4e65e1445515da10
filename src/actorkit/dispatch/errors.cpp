#include "actorkit/dispatch/errors.hpp"

#include <string>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "absl/strings/str_join.h"
#include "actorkit/common/overloaded.hpp"

namespace actorkit::dispatch {

auto ToString(const BuildError& error) -> std::string {
  return std::visit(
      Overloaded{
          [](const EmptyMethodName&) -> std::string {
            return "method name must not be empty";
          },
          [](const IllegalMethodName& e) -> std::string {
            return fmt::format(
                "illegal method name '{}': {}", e.name, e.reason);
          },
          [](const ReservedNumberMisuse& e) -> std::string {
            return fmt::format(
                "method number {} is reserved (only 0 and 1 may be "
                "registered below {})",
                e.attempted, kFirstAvailable);
          },
          [](const DuplicateSelector& e) -> std::string {
            return fmt::format(
                "method number {} is shared by: {}", e.selector,
                absl::StrJoin(e.names, ", "));
          },
          [](const MissingHandler& e) -> std::string {
            return fmt::format("no handler bound for method '{}'", e.label);
          },
      },
      error);
}

auto ToString(const DispatchError& error) -> std::string {
  return std::visit(
      Overloaded{
          [](const MethodNotFound& e) -> std::string {
            return fmt::format("method {} not found", e.selector);
          },
          [](const HandlerFailed& e) -> std::string {
            return fmt::format(
                "handler failed ({} byte payload)", e.payload.size());
          },
      },
      error);
}

BuildErrorException::BuildErrorException(BuildError error)
    : error_(std::move(error)), message_(ToString(error_)) {
}

}  // namespace actorkit::dispatch

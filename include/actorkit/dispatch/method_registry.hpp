#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "actorkit/dispatch/errors.hpp"
#include "actorkit/dispatch/method_number.hpp"
#include "actorkit/dispatch/method_resolver.hpp"
#include "actorkit/dispatch/method_table.hpp"

namespace actorkit::dispatch {

// One entry of the registration list: a method name to hash, or an explicit
// selector, bound to a handler.
struct MethodSpec {
  std::variant<std::string, MethodNumber> key;
  // Display name for explicit entries ("Constructor"). Unused for named ones.
  std::string label;
  Handler handler;

  static auto Named(std::string name, Handler handler) -> MethodSpec;

  // Hashes ToPascalCase(identifier).
  static auto FromIdentifier(std::string_view identifier, Handler handler)
      -> MethodSpec;

  static auto Explicit(
      MethodNumber number, Handler handler, std::string label = {})
      -> MethodSpec;

  [[nodiscard]] auto IsExplicit() const -> bool {
    return std::holds_alternative<MethodNumber>(key);
  }

  // Name used in diagnostics: the method name, the label, or "#<number>".
  [[nodiscard]] auto DisplayName() const -> std::string;
};

// Assembles a MethodTable from an ordered registration list.
//
// Lifecycle: entries are added while Building; Build() consumes the registry
// and either yields an immutable table or the first BuildError. There is no
// way back: a different table needs a new registry.
class MethodRegistry {
 public:
  explicit MethodRegistry(
      std::string actor_name = "actor", MethodResolver resolver = {});

  auto Add(MethodSpec spec) -> MethodRegistry&;

  auto Add(std::string name, Handler handler) -> MethodRegistry& {
    return Add(MethodSpec::Named(std::move(name), std::move(handler)));
  }

  auto Add(MethodNumber number, Handler handler, std::string label = {})
      -> MethodRegistry& {
    return Add(
        MethodSpec::Explicit(number, std::move(handler), std::move(label)));
  }

  [[nodiscard]] auto Size() const -> size_t {
    return specs_.size();
  }

  // Entries are checked in insertion order; the first failing entry decides
  // the error. On a collision every entry sharing the selector is named.
  [[nodiscard]] auto Build() && -> std::expected<MethodTable, BuildError>;

  // Same as Build(), throwing BuildErrorException on failure.
  auto BuildOrThrow() && -> MethodTable;

 private:
  [[nodiscard]] auto ResolveSpec(const MethodSpec& spec) const
      -> std::expected<MethodNumber, BuildError>;

  [[nodiscard]] auto CollectDuplicates(MethodNumber selector) const
      -> DuplicateSelector;

  std::string actor_name_;
  MethodResolver resolver_;
  std::vector<MethodSpec> specs_;
};

// Builds a table from a complete registration list in one call.
auto BuildMethodTable(
    std::vector<MethodSpec> specs, MethodResolver resolver = {})
    -> std::expected<MethodTable, BuildError>;

}  // namespace actorkit::dispatch

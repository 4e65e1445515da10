#include "actorkit/dispatch/method_registry.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "actorkit/common/overloaded.hpp"

namespace actorkit::dispatch {

auto MethodSpec::Named(std::string name, Handler handler) -> MethodSpec {
  return MethodSpec{
      .key = std::move(name), .label = {}, .handler = std::move(handler)};
}

auto MethodSpec::FromIdentifier(std::string_view identifier, Handler handler)
    -> MethodSpec {
  return Named(ToPascalCase(identifier), std::move(handler));
}

auto MethodSpec::Explicit(
    MethodNumber number, Handler handler, std::string label) -> MethodSpec {
  return MethodSpec{
      .key = number, .label = std::move(label), .handler = std::move(handler)};
}

auto MethodSpec::DisplayName() const -> std::string {
  return std::visit(
      Overloaded{
          [](const std::string& name) -> std::string { return name; },
          [this](MethodNumber number) -> std::string {
            if (!label.empty()) {
              return label;
            }
            return fmt::format("#{}", number);
          },
      },
      key);
}

MethodRegistry::MethodRegistry(std::string actor_name, MethodResolver resolver)
    : actor_name_(std::move(actor_name)), resolver_(std::move(resolver)) {
}

auto MethodRegistry::Add(MethodSpec spec) -> MethodRegistry& {
  specs_.push_back(std::move(spec));
  return *this;
}

auto MethodRegistry::ResolveSpec(const MethodSpec& spec) const
    -> std::expected<MethodNumber, BuildError> {
  if (const auto* number = std::get_if<MethodNumber>(&spec.key)) {
    if (!IsPermittedExplicit(*number)) {
      return std::unexpected(ReservedNumberMisuse{.attempted = *number});
    }
    return *number;
  }
  return resolver_.Resolve(std::get<std::string>(spec.key));
}

auto MethodRegistry::CollectDuplicates(MethodNumber selector) const
    -> DuplicateSelector {
  DuplicateSelector duplicate{.names = {}, .selector = selector};
  for (const auto& spec : specs_) {
    auto resolved = ResolveSpec(spec);
    if (resolved && *resolved == selector) {
      duplicate.names.push_back(spec.DisplayName());
    }
  }
  return duplicate;
}

auto MethodRegistry::Build() && -> std::expected<MethodTable, BuildError> {
  auto fail = [this](BuildError error) {
    spdlog::error(
        "method table for '{}' rejected: {}", actor_name_, ToString(error));
    return std::unexpected(std::move(error));
  };

  MethodTable table;
  for (auto& spec : specs_) {
    if (!spec.handler) {
      return fail(MissingHandler{.label = spec.DisplayName()});
    }

    auto selector = ResolveSpec(spec);
    if (!selector) {
      return fail(std::move(selector.error()));
    }

    if (table.entries_.contains(*selector)) {
      return fail(CollectDuplicates(*selector));
    }

    spdlog::debug("{}: {} -> {}", actor_name_, spec.DisplayName(), *selector);
    MethodEntry entry{
        .selector = *selector, .handler = std::move(spec.handler)};
    table.entries_.emplace(*selector, std::move(entry));
  }

  spdlog::info(
      "method table for '{}' built with {} entries", actor_name_,
      table.Size());
  return table;
}

auto MethodRegistry::BuildOrThrow() && -> MethodTable {
  auto table = std::move(*this).Build();
  if (!table) {
    throw BuildErrorException(std::move(table.error()));
  }
  return std::move(*table);
}

auto BuildMethodTable(std::vector<MethodSpec> specs, MethodResolver resolver)
    -> std::expected<MethodTable, BuildError> {
  MethodRegistry registry("actor", std::move(resolver));
  for (auto& spec : specs) {
    registry.Add(std::move(spec));
  }
  return std::move(registry).Build();
}

}  // namespace actorkit::dispatch

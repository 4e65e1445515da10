#include "actorkit/config/actor_manifest.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "actorkit/dispatch/method_registry.hpp"
#include "actorkit/dispatch/method_resolver.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace actorkit::config {

namespace fs = std::filesystem;

namespace {

auto ParseMethod(
    const toml::table& entry, size_t index, std::string_view source_name)
    -> ManifestMethod {
  ManifestMethod method;

  if (auto name = entry["name"]) {
    if (!name.is_string()) {
      throw ConfigError(
          fmt::format(
              "{}: methods[{}]: 'name' must be a string", source_name, index));
    }
    method.name = name.value<std::string>();
  }

  if (auto number = entry["number"]) {
    if (!number.is_integer()) {
      throw ConfigError(
          fmt::format(
              "{}: methods[{}]: 'number' must be an integer", source_name,
              index));
    }
    int64_t value = *number.value<int64_t>();
    if (value < 0) {
      throw ConfigError(
          fmt::format(
              "{}: methods[{}]: number must not be negative", source_name,
              index));
    }
    method.number = static_cast<dispatch::MethodNumber>(value);
  }

  if (!method.name && !method.number) {
    throw ConfigError(
        fmt::format(
            "{}: methods[{}]: needs 'name' or 'number'", source_name, index));
  }

  auto handler = entry["handler"];
  if (handler && !handler.is_string()) {
    throw ConfigError(
        fmt::format(
            "{}: methods[{}]: 'handler' must be a string", source_name, index));
  }
  auto handler_key = handler.value<std::string>();
  if (!handler_key || handler_key->empty()) {
    throw ConfigError(
        fmt::format(
            "{}: methods[{}]: missing required field 'handler'", source_name,
            index));
  }
  method.handler = *handler_key;

  return method;
}

}  // namespace

auto ParseManifest(std::string_view text, std::string_view source_name)
    -> ActorManifest {
  toml::table tbl;
  try {
    tbl = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    throw ConfigError(
        fmt::format("{}: failed to parse: {}", source_name, e.description()));
  }

  ActorManifest manifest;

  // [actor] section
  auto actor = tbl["actor"];
  if (!actor) {
    throw ConfigError(fmt::format("{}: missing [actor] section", source_name));
  }
  auto name = actor["name"].value<std::string>();
  if (!name || name->empty()) {
    throw ConfigError(
        fmt::format("{}: missing required field 'actor.name'", source_name));
  }
  manifest.name = *name;
  if (auto strict_names = actor["strict_names"]) {
    if (!strict_names.is_boolean()) {
      throw ConfigError(
          fmt::format(
              "{}: 'actor.strict_names' must be a boolean", source_name));
    }
    manifest.strict_names = *strict_names.value<bool>();
  }

  // [logging] section (optional)
  if (auto logging = tbl["logging"]) {
    if (auto level_node = logging["level"]) {
      if (!level_node.is_string()) {
        throw ConfigError(
            fmt::format("{}: 'logging.level' must be a string", source_name));
      }
      auto level_name = level_node.value<std::string>();
      auto level = ParseLogLevel(*level_name);
      if (!level) {
        throw ConfigError(
            fmt::format(
                "{}: unknown log level '{}'", source_name, *level_name));
      }
      manifest.logging.level = *level;
    }
  }

  // [[methods]] (an actor with no methods is allowed)
  if (auto methods = tbl["methods"]) {
    const auto* methods_arr = methods.as_array();
    if (methods_arr == nullptr) {
      throw ConfigError(
          fmt::format("{}: 'methods' must be an array of tables", source_name));
    }
    for (size_t i = 0; i < methods_arr->size(); ++i) {
      const auto* entry = methods_arr->get(i)->as_table();
      if (entry == nullptr) {
        throw ConfigError(
            fmt::format("{}: methods[{}] is not a table", source_name, i));
      }
      manifest.methods.push_back(ParseMethod(*entry, i, source_name));
    }
  }

  return manifest;
}

auto LoadManifest(const fs::path& path) -> ActorManifest {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError(fmt::format("cannot open manifest '{}'", path.string()));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return ParseManifest(buffer.str(), path.string());
}

auto BuildFromManifest(
    const ActorManifest& manifest, const HandlerCatalog& catalog)
    -> std::expected<dispatch::MethodTable, dispatch::BuildError> {
  dispatch::MethodRegistry registry(
      manifest.name,
      dispatch::MethodResolver(
          std::make_shared<dispatch::Blake2bHasher>(),
          {.strict_names = manifest.strict_names}));

  for (const auto& method : manifest.methods) {
    dispatch::Handler handler;
    if (auto it = catalog.find(method.handler); it != catalog.end()) {
      handler = it->second;
    }
    // An unbound handler is reported by the registry as MissingHandler.
    if (method.number) {
      registry.Add(
          *method.number, std::move(handler), method.name.value_or(""));
    } else {
      registry.Add(*method.name, std::move(handler));
    }
  }

  return std::move(registry).Build();
}

}  // namespace actorkit::config

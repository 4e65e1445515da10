#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "actorkit/common/logging.hpp"
#include "actorkit/dispatch/errors.hpp"
#include "actorkit/dispatch/method_number.hpp"
#include "actorkit/dispatch/method_table.hpp"

namespace actorkit::config {

// Raised for malformed manifests. Messages start with the source name.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// One [[methods]] entry. At least one of name/number is set; when both are,
// the number is used and the name is only a label.
struct ManifestMethod {
  std::optional<std::string> name;
  std::optional<dispatch::MethodNumber> number;
  std::string handler;
};

struct ActorManifest {
  std::string name;
  bool strict_names = false;
  LoggingConfig logging;
  std::vector<ManifestMethod> methods;
};

// Handler keys referenced by manifests, resolved by the embedding program.
using HandlerCatalog = absl::flat_hash_map<std::string, dispatch::Handler>;

// Parse manifest text. `source_name` prefixes error messages.
// Throws ConfigError.
auto ParseManifest(std::string_view text, std::string_view source_name)
    -> ActorManifest;

// Parse a manifest file. Throws ConfigError.
auto LoadManifest(const std::filesystem::path& path) -> ActorManifest;

// Registers the manifest's methods in order. A handler key missing from
// `catalog` fails with MissingHandler.
auto BuildFromManifest(
    const ActorManifest& manifest, const HandlerCatalog& catalog)
    -> std::expected<dispatch::MethodTable, dispatch::BuildError>;

}  // namespace actorkit::config

#include "actorkit/common/logging.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace actorkit {

namespace {

constexpr auto kLevelNames =
    std::to_array<std::pair<std::string_view, spdlog::level::level_enum>>({
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    });

}  // namespace

auto ParseLogLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum> {
  for (const auto& [level_name, level] : kLevelNames) {
    if (level_name == name) {
      return level;
    }
  }
  return std::nullopt;
}

void ConfigureLogging(const LoggingConfig& config) {
  spdlog::set_pattern("[actorkit][%l] %v");
  spdlog::set_level(config.level);
}

}  // namespace actorkit

#pragma once

#include <optional>
#include <string_view>

#include <spdlog/common.h>

namespace actorkit {

struct LoggingConfig {
  spdlog::level::level_enum level = spdlog::level::info;
};

// Accepts trace, debug, info, warn, error, critical and off.
auto ParseLogLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum>;

// Applies `config` to spdlog's default logger.
void ConfigureLogging(const LoggingConfig& config);

}  // namespace actorkit

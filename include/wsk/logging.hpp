#pragma once

#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace wsk {

// "trace", "debug", "info", "warn", "error" or "off"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

/**
 * Route library logging to stderr at the given level.
 * An empty level falls back to WSK_LOG_LEVEL, then to "warn".
 * Returns false if the level name is not recognized (warn is used).
 */
bool init_logging(const std::string& level);

} // namespace wsk

#include "wsk/logging.hpp"
#include "wsk/platform.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace wsk {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

bool init_logging(const std::string& level) {
    std::string name = level;
    if (name.empty()) {
        name = get_env("WSK_LOG_LEVEL").value_or("warn");
    }

    auto logger = spdlog::get("wsk");
    if (!logger) {
        logger = spdlog::stderr_color_mt("wsk");
        logger->set_pattern("[%l] %v");
        spdlog::set_default_logger(logger);
    }

    auto parsed = parse_log_level(name);
    spdlog::set_level(parsed.value_or(spdlog::level::warn));
    if (!parsed) {
        spdlog::warn("unknown log level '{}', using warn", name);
    }
    return parsed.has_value();
}

} // namespace wsk

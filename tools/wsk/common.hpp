/**
 * wsk CLI - Common utilities and types
 */

#pragma once

#include <wsk/wsk.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace wsk::cli {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_RUN = 1;
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_CANCELLED = 130;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    std::string log_level;         // --log-level
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

// --log-level wins, then -v / -q, then WSK_LOG_LEVEL
inline void init_cli_logging(const GlobalOptions& opts) {
    std::string level = opts.log_level;
    if (level.empty() && opts.verbose) level = "debug";
    if (level.empty() && opts.quiet) level = "error";
    if (!init_logging(level) && !opts.json) {
        std::cerr << "Warning: unknown log level '" << level << "'" << std::endl;
    }
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << dump_json(j) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << dump_json(j) << std::endl;
}

// Configuration problems map to 2, anything else to 1
inline int report_error(const Error& error, const GlobalOptions& opts) {
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error.message();
        j["code"] = error_code_to_string(error.code());
        output_json(j);
    } else {
        std::cerr << "Error: " << error.toString() << std::endl;
    }
    return error.isConfigError() ? EXIT_CONFIG_ERROR : EXIT_FAILURE_RUN;
}

inline int exit_code_for(RunStatus status) {
    switch (status) {
        case RunStatus::Success:
        case RunStatus::NoOp:
            return EXIT_OK;
        case RunStatus::Failure:
            return EXIT_FAILURE_RUN;
        case RunStatus::Cancelled:
            return EXIT_CANCELLED;
    }
    return EXIT_FAILURE_RUN;
}

/**
 * Load the workspace named by --config, WSK_CONFIG or ./wsk.json.
 */
inline Result<std::unique_ptr<Workspace>> open_workspace(const GlobalOptions& opts) {
    std::string path = resolve_config_path(
        opts.config.empty() ? std::nullopt : std::make_optional(opts.config));
    return Workspace::open(path);
}

inline std::set<std::string> to_target_set(const std::vector<std::string>& targets) {
    return std::set<std::string>(targets.begin(), targets.end());
}

inline std::string format_duration(std::chrono::milliseconds d) {
    if (d.count() < 1000) {
        return std::to_string(d.count()) + "ms";
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1fs", static_cast<double>(d.count()) / 1000.0);
    return buf;
}

} // namespace wsk::cli

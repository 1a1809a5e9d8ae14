#pragma once

/**
 * @file workspace_config.hpp
 * @brief The workspace file (wsk.json)
 *
 *   {
 *     "$schema": "wsk.workspace.v1",
 *     "manifests": ["packages"],
 *     "skills": "skills.json",
 *     "environment": { "base_root": "env/base", "overlays": ["env/dev"] },
 *     "defaults": { "concurrency": 4, "timeout_ms": 600000,
 *                   "grace_period_ms": 2000, "max_attempts": 1 },
 *     "artifacts_dir": ".wsk/artifacts"
 *   }
 *
 * Relative paths resolve against the directory holding the file, which is
 * also the workspace root unless "root" says otherwise.
 */

#include "wsk/result.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace wsk {

constexpr const char* WORKSPACE_CONFIG_FILE = "wsk.json";
constexpr const char* WORKSPACE_SCHEMA = "wsk.workspace.v1";

struct RunDefaults {
    size_t concurrency = 0;
    std::optional<std::chrono::milliseconds> timeout;
    std::chrono::milliseconds grace_period{2000};
    int max_attempts = 1;
    bool retry_only_timeouts = false;
};

struct WorkspaceConfig {
    std::string source_path;
    std::string root;                    // absolute workspace root
    std::vector<std::string> manifests;  // absolute files or directories
    std::string skills;                  // absolute catalog path
    std::string base_root;
    std::vector<std::string> overlays;
    RunDefaults defaults;
    std::string artifacts_dir;           // empty: no artifacts
};

/**
 * @brief Parse a workspace file
 * @param config_dir Directory relative paths resolve against
 */
ParseResult<WorkspaceConfig> parse_workspace_config(const std::string& json_str,
                                                    const std::string& config_dir,
                                                    const std::string& source_path = "");

/// Read and parse; FILE_NOT_FOUND or INVALID_CONFIG
Result<WorkspaceConfig> load_workspace_config(const std::string& path);

/**
 * Locate the workspace file.
 * Priority: explicit path > WSK_CONFIG env > ./wsk.json
 */
std::string resolve_config_path(const std::optional<std::string>& explicit_path);

} // namespace wsk

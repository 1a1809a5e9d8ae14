#pragma once

/**
 * @file manifest.hpp
 * @brief JSON readers for package manifests and skill catalogs
 *
 * Package manifest (one per package, file name wsk_package.json):
 *
 *   {
 *     "name": "core",
 *     "path": "libs/core",
 *     "dependencies": ["base"],
 *     "capabilities": ["build", "test", "lint"],
 *     "metadata": { "owner": "platform" }
 *   }
 *
 * A file may instead hold several packages as {"packages": [ ... ]}.
 *
 * Skill catalog:
 *
 *   {
 *     "skills": [{
 *       "name": "lint",
 *       "command": ["lint-tool", "--strict", "{package_path}"],
 *       "requires": ["lint"],
 *       "success_exit_codes": [0],
 *       "timeout_ms": 60000,
 *       "environment": { "LINT_STRICT": "1" },
 *       "classifiers": [
 *         { "pattern": "warning:", "category": "lint violations found" }
 *       ]
 *     }]
 *   }
 */

#include "wsk/result.hpp"
#include "wsk/skill.hpp"
#include "wsk/types.hpp"

#include <string>
#include <vector>

namespace wsk {

/// File name searched for when a manifest path is a directory
constexpr const char* PACKAGE_MANIFEST_FILE = "wsk_package.json";

// Parse one manifest file; yields one package or a "packages" array
ParseResult<std::vector<Package>> parse_package_manifest(const std::string& json_str,
                                                         const std::string& source_path = "");

// Parse a skill catalog document
ParseResult<std::vector<Skill>> parse_skill_catalog(const std::string& json_str,
                                                    const std::string& source_path = "");

/**
 * @brief Load packages from files and directories
 *
 * Files are parsed directly; directories are searched recursively for
 * wsk_package.json. A package without an explicit path gets the manifest's
 * directory (relative to workspace_root) as its path.
 */
Result<std::vector<Package>> load_manifests(const std::vector<std::string>& locations,
                                            const std::string& workspace_root);

/// Load a skill catalog file
Result<std::vector<Skill>> load_skill_catalog(const std::string& path);

} // namespace wsk

#include "wsk/workspace_config.hpp"
#include "wsk/platform.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace wsk {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

std::optional<long long> get_positive(const nlohmann::json& j, const std::string& key,
                                      std::vector<std::string>& warnings) {
    if (!j.contains(key)) return std::nullopt;
    if (!j[key].is_number_integer() || j[key].get<long long>() <= 0) {
        warnings.push_back("defaults." + key + " must be a positive integer, ignored");
        return std::nullopt;
    }
    return j[key].get<long long>();
}

std::string absolute_dir(const std::string& dir) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(dir.empty() ? "." : dir, ec);
    if (ec) return dir;
    return to_portable_path(abs.lexically_normal().string());
}

} // namespace

ParseResult<WorkspaceConfig> parse_workspace_config(const std::string& json_str,
                                                    const std::string& config_dir,
                                                    const std::string& source_path) {
    ParseResult<WorkspaceConfig> result;
    WorkspaceConfig& cfg = result.value;
    cfg.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        if (auto schema = get_string(j, "$schema")) {
            if (*schema != WORKSPACE_SCHEMA) {
                result.warnings.push_back("unexpected $schema " + *schema +
                                          " (expected " + WORKSPACE_SCHEMA + ")");
            }
        }

        std::string base = absolute_dir(config_dir);
        cfg.root = resolve_path(base, get_string(j, "root").value_or(""));

        if (!j.contains("manifests") || !j["manifests"].is_array()) {
            result.error = "\"manifests\" must be an array of paths";
            return result;
        }
        for (const auto& m : get_string_array(j, "manifests")) {
            cfg.manifests.push_back(resolve_path(base, m));
        }
        if (cfg.manifests.empty()) {
            result.warnings.push_back("no manifest locations configured");
        }

        auto skills = get_string(j, "skills");
        if (!skills || skills->empty()) {
            result.error = "\"skills\" path missing";
            return result;
        }
        cfg.skills = resolve_path(base, *skills);

        if (!j.contains("environment") || !j["environment"].is_object()) {
            result.error = "\"environment\" section missing";
            return result;
        }
        const auto& env = j["environment"];
        auto base_root = get_string(env, "base_root");
        if (!base_root || base_root->empty()) {
            result.error = "environment.base_root missing";
            return result;
        }
        cfg.base_root = resolve_path(base, *base_root);
        for (const auto& overlay : get_string_array(env, "overlays")) {
            cfg.overlays.push_back(resolve_path(base, overlay));
        }

        if (j.contains("defaults")) {
            const auto& d = j["defaults"];
            if (!d.is_object()) {
                result.warnings.push_back("\"defaults\" is not an object, ignored");
            } else {
                if (auto v = get_positive(d, "concurrency", result.warnings)) {
                    cfg.defaults.concurrency = static_cast<size_t>(*v);
                }
                if (auto v = get_positive(d, "timeout_ms", result.warnings)) {
                    cfg.defaults.timeout = std::chrono::milliseconds(*v);
                }
                if (auto v = get_positive(d, "grace_period_ms", result.warnings)) {
                    cfg.defaults.grace_period = std::chrono::milliseconds(*v);
                }
                if (auto v = get_positive(d, "max_attempts", result.warnings)) {
                    cfg.defaults.max_attempts = static_cast<int>(*v);
                }
                if (d.contains("retry_only_timeouts") && d["retry_only_timeouts"].is_boolean()) {
                    cfg.defaults.retry_only_timeouts = d["retry_only_timeouts"].get<bool>();
                }
            }
        }

        if (auto artifacts = get_string(j, "artifacts_dir")) {
            if (!artifacts->empty()) {
                cfg.artifacts_dir = resolve_path(base, *artifacts);
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

Result<WorkspaceConfig> load_workspace_config(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return Result<WorkspaceConfig>::err(Error(ErrorCode::FILE_NOT_FOUND,
            "workspace config not found: " + path));
    }

    auto parsed = parse_workspace_config(*content, get_parent_directory(path), path);
    if (!parsed.ok) {
        return Result<WorkspaceConfig>::err(Error(ErrorCode::INVALID_CONFIG,
            parsed.error).withContext(path));
    }
    for (const auto& w : parsed.warnings) {
        spdlog::warn("{}: {}", path, w);
    }

    return Result<WorkspaceConfig>::ok(std::move(parsed.value));
}

std::string resolve_config_path(const std::optional<std::string>& explicit_path) {
    if (explicit_path && !explicit_path->empty()) {
        return *explicit_path;
    }

    auto env_path = get_env("WSK_CONFIG");
    if (env_path && !env_path->empty()) {
        return *env_path;
    }

    return WORKSPACE_CONFIG_FILE;
}

} // namespace wsk

#include "wsk/manifest.hpp"
#include "wsk/platform.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace wsk {

namespace {

using json = nlohmann::json;

std::optional<std::string> get_string(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const json& j, const std::string& key,
                                          std::vector<std::string>& warnings,
                                          const std::string& context) {
    std::vector<std::string> result;
    if (!j.contains(key)) return result;
    if (!j[key].is_array()) {
        warnings.push_back(context + ": \"" + key + "\" is not an array");
        return result;
    }
    for (const auto& elem : j[key]) {
        if (elem.is_string()) {
            result.push_back(elem.get<std::string>());
        } else {
            warnings.push_back(context + ": ignoring non-string entry in \"" + key + "\"");
        }
    }
    return result;
}

std::optional<Package> parse_package(const json& j, const std::string& source_path,
                                     std::string& error, std::vector<std::string>& warnings) {
    if (!j.is_object()) {
        error = "package entry must be an object";
        return std::nullopt;
    }

    Package pkg;
    pkg.source_path = source_path;

    auto name = get_string(j, "name");
    if (!name || name->empty()) {
        error = "package \"name\" missing";
        return std::nullopt;
    }
    pkg.name = *name;

    pkg.path = get_string(j, "path").value_or("");
    pkg.dependencies = get_string_array(j, "dependencies", warnings, pkg.name);
    pkg.capabilities = get_string_array(j, "capabilities", warnings, pkg.name);

    if (j.contains("metadata") && j["metadata"].is_object()) {
        for (auto& [key, val] : j["metadata"].items()) {
            if (val.is_string()) {
                pkg.metadata[key] = val.get<std::string>();
            }
        }
    }

    return pkg;
}

std::optional<Skill> parse_skill(const json& j, std::string& error,
                                 std::vector<std::string>& warnings) {
    if (!j.is_object()) {
        error = "skill entry must be an object";
        return std::nullopt;
    }

    Skill skill;
    auto name = get_string(j, "name");
    if (!name || name->empty()) {
        error = "skill \"name\" missing";
        return std::nullopt;
    }
    skill.name = *name;
    skill.description = get_string(j, "description").value_or("");

    // "command" may be an argv array or a single string run through sh -c
    if (j.contains("command") && j["command"].is_string()) {
        skill.command = {"/bin/sh", "-c", j["command"].get<std::string>()};
    } else {
        skill.command = get_string_array(j, "command", warnings, skill.name);
    }
    if (skill.command.empty()) {
        error = "skill " + skill.name + " has no \"command\"";
        return std::nullopt;
    }

    skill.requires_capabilities = get_string_array(j, "requires", warnings, skill.name);

    if (j.contains("success_exit_codes") && j["success_exit_codes"].is_array()) {
        skill.success_exit_codes.clear();
        for (const auto& code : j["success_exit_codes"]) {
            if (code.is_number_integer()) {
                skill.success_exit_codes.push_back(code.get<int>());
            }
        }
        if (skill.success_exit_codes.empty()) {
            warnings.push_back(skill.name + ": empty success_exit_codes, using [0]");
            skill.success_exit_codes.push_back(0);
        }
    }

    if (j.contains("timeout_ms") && j["timeout_ms"].is_number_integer()) {
        auto ms = j["timeout_ms"].get<long long>();
        if (ms > 0) {
            skill.timeout = std::chrono::milliseconds(ms);
        }
    }

    if (auto wd = get_string(j, "working_directory")) {
        skill.working_directory = *wd;
    }

    if (j.contains("environment") && j["environment"].is_object()) {
        for (auto& [key, val] : j["environment"].items()) {
            if (val.is_string()) {
                skill.environment[key] = EnvValue(val.get<std::string>());
            } else if (val.is_object()) {
                EnvValue ev;
                ev.op = parse_env_op(val.value("op", std::string("set"))).value_or(EnvOp::Set);
                ev.value = val.value("value", std::string());
                ev.separator = val.value("separator", std::string(1, get_path_separator()));
                skill.environment[key] = ev;
            }
        }
    }

    if (j.contains("classifiers") && j["classifiers"].is_array()) {
        for (const auto& c : j["classifiers"]) {
            auto pattern = c.is_object() ? get_string(c, "pattern") : std::nullopt;
            if (!pattern || pattern->empty()) {
                warnings.push_back(skill.name + ": classifier without a pattern ignored");
                continue;
            }
            ClassifierRule rule;
            rule.pattern = *pattern;
            rule.category = get_string(c, "category").value_or(*pattern);
            auto stream = parse_classifier_stream(get_string(c, "stream").value_or("any"));
            if (!stream) {
                warnings.push_back(skill.name + ": unknown classifier stream, using any");
            }
            rule.stream = stream.value_or(ClassifierStream::Any);
            rule.force_failure = get_string(c, "outcome").value_or("") == "failure";
            skill.classifiers.push_back(std::move(rule));
        }
    }

    return skill;
}

} // namespace

ParseResult<std::vector<Package>> parse_package_manifest(const std::string& json_str,
                                                         const std::string& source_path) {
    ParseResult<std::vector<Package>> result;

    try {
        auto j = json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        std::vector<json> entries;
        if (j.contains("packages")) {
            if (!j["packages"].is_array()) {
                result.error = "\"packages\" must be an array";
                return result;
            }
            for (const auto& entry : j["packages"]) {
                entries.push_back(entry);
            }
        } else {
            entries.push_back(j);
        }

        for (const auto& entry : entries) {
            std::string error;
            auto pkg = parse_package(entry, source_path, error, result.warnings);
            if (!pkg) {
                result.error = error;
                return result;
            }
            result.value.push_back(std::move(*pkg));
        }

        result.ok = true;
        return result;

    } catch (const json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ParseResult<std::vector<Skill>> parse_skill_catalog(const std::string& json_str,
                                                    const std::string& source_path) {
    ParseResult<std::vector<Skill>> result;

    try {
        auto j = json::parse(json_str);

        if (!j.is_object() || !j.contains("skills") || !j["skills"].is_array()) {
            result.error = "skill catalog must be an object with a \"skills\" array";
            if (!source_path.empty()) result.error += " (" + source_path + ")";
            return result;
        }

        for (const auto& entry : j["skills"]) {
            std::string error;
            auto skill = parse_skill(entry, error, result.warnings);
            if (!skill) {
                result.error = error;
                return result;
            }
            result.value.push_back(std::move(*skill));
        }

        result.ok = true;
        return result;

    } catch (const json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

Result<std::vector<Package>> load_manifests(const std::vector<std::string>& locations,
                                            const std::string& workspace_root) {
    std::vector<std::string> files;
    for (const auto& location : locations) {
        std::string resolved = resolve_path(workspace_root, location);
        if (is_directory(resolved)) {
            auto found = find_files_named(resolved, PACKAGE_MANIFEST_FILE);
            files.insert(files.end(), found.begin(), found.end());
        } else if (is_regular_file(resolved)) {
            files.push_back(resolved);
        } else {
            return Result<std::vector<Package>>::err(Error(ErrorCode::FILE_NOT_FOUND,
                "manifest location not found: " + resolved));
        }
    }

    std::vector<Package> packages;
    for (const auto& file : files) {
        auto content = read_file(file);
        if (!content) {
            return Result<std::vector<Package>>::err(Error(ErrorCode::IO_ERROR,
                "cannot read manifest: " + file));
        }

        auto parsed = parse_package_manifest(*content, file);
        if (!parsed.ok) {
            return Result<std::vector<Package>>::err(Error(ErrorCode::INVALID_MANIFEST,
                parsed.error).withContext(file));
        }
        for (const auto& w : parsed.warnings) {
            spdlog::warn("{}: {}", file, w);
        }

        std::string manifest_dir = get_parent_directory(file);
        for (auto& pkg : parsed.value) {
            if (pkg.path.empty()) {
                auto rel = std::filesystem::path(manifest_dir).lexically_relative(workspace_root);
                pkg.path = rel.empty() ? manifest_dir : to_portable_path(rel.string());
            }
            packages.push_back(std::move(pkg));
        }
    }

    spdlog::debug("loaded {} packages from {} manifest files", packages.size(), files.size());
    return Result<std::vector<Package>>::ok(std::move(packages));
}

Result<std::vector<Skill>> load_skill_catalog(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return Result<std::vector<Skill>>::err(Error(ErrorCode::FILE_NOT_FOUND,
            "skill catalog not found: " + path));
    }

    auto parsed = parse_skill_catalog(*content, path);
    if (!parsed.ok) {
        return Result<std::vector<Skill>>::err(Error(ErrorCode::INVALID_SKILL,
            parsed.error).withContext(path));
    }
    for (const auto& w : parsed.warnings) {
        spdlog::warn("{}: {}", path, w);
    }

    return Result<std::vector<Skill>>::ok(std::move(parsed.value));
}

} // namespace wsk

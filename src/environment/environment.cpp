#include "wsk/environment.hpp"
#include "wsk/platform.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace wsk {

namespace {

EnvValue parse_env_value(const nlohmann::json& j) {
    EnvValue ev;

    if (j.is_string()) {
        ev.op = EnvOp::Set;
        ev.value = j.get<std::string>();
        return ev;
    }

    if (j.is_object()) {
        std::string op_str = j.value("op", std::string("set"));
        ev.op = parse_env_op(op_str).value_or(EnvOp::Set);
        ev.value = j.value("value", std::string());
        ev.separator = j.value("separator", std::string(1, get_path_separator()));
    }

    return ev;
}

Result<EnvMap> load_root(const std::string& root) {
    if (!is_directory(root)) {
        return Result<EnvMap>::err(Error(ErrorCode::MISSING_ROOT,
                                         "environment root does not exist: " + root));
    }

    std::string env_file = join_path(root, ENV_ROOT_FILE);
    auto content = read_file(env_file);
    if (!content) {
        return Result<EnvMap>::err(Error(ErrorCode::MISSING_ROOT,
                                         "environment root has no " + std::string(ENV_ROOT_FILE) +
                                         ": " + root));
    }

    auto parsed = parse_env_root_file(*content, env_file);
    if (!parsed.ok) {
        return Result<EnvMap>::err(Error(ErrorCode::MISSING_ROOT,
                                         "environment root is not loadable: " + root +
                                         " (" + parsed.error + ")"));
    }
    for (const auto& w : parsed.warnings) {
        spdlog::warn("{}: {}", env_file, w);
    }

    return Result<EnvMap>::ok(std::move(parsed.value));
}

} // namespace

std::optional<EnvOp> parse_env_op(const std::string& s) {
    if (s == "set") return EnvOp::Set;
    if (s == "prepend") return EnvOp::Prepend;
    if (s == "append") return EnvOp::Append;
    if (s == "unset") return EnvOp::Unset;
    return std::nullopt;
}

std::optional<std::string> apply_env_op(const std::string& key,
                                        const EnvValue& env_val,
                                        const EnvTable& current) {
    switch (env_val.op) {
        case EnvOp::Set:
            return env_val.value;

        case EnvOp::Prepend: {
            auto it = current.find(key);
            if (it != current.end() && !it->second.empty()) {
                return env_val.value + env_val.separator + it->second;
            }
            return env_val.value;
        }

        case EnvOp::Append: {
            auto it = current.find(key);
            if (it != current.end() && !it->second.empty()) {
                return it->second + env_val.separator + env_val.value;
            }
            return env_val.value;
        }

        case EnvOp::Unset:
            return std::nullopt;
    }

    return env_val.value;
}

ParseResult<EnvMap> parse_env_root_file(const std::string& json_str,
                                        const std::string& source_path) {
    ParseResult<EnvMap> result;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        if (j.contains("environment")) {
            const auto& env = j["environment"];
            if (!env.is_object()) {
                result.error = "\"environment\" must be an object";
                return result;
            }
            for (auto& [key, val] : env.items()) {
                if (!val.is_string() && !val.is_object()) {
                    result.warnings.push_back("ignoring non-string value for " + key);
                    continue;
                }
                if (val.is_object() && val.contains("op") && val["op"].is_string() &&
                    !parse_env_op(val["op"].get<std::string>())) {
                    result.warnings.push_back("unknown op for " + key + ", treating as set");
                }
                result.value[key] = parse_env_value(val);
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        if (!source_path.empty()) result.error += " in " + source_path;
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

EnvTable to_env_table(const std::unordered_map<std::string, std::string>& env) {
    return EnvTable(env.begin(), env.end());
}

// ============================================================================
// EnvironmentContext
// ============================================================================

Result<EnvironmentContext> EnvironmentContext::build(const std::string& base_root,
                                                     const std::vector<std::string>& overlays,
                                                     const EnvTable& ambient) {
    EnvironmentContext ctx;
    ctx.base_root_ = base_root;
    ctx.overlays_ = overlays;
    ctx.table_ = ambient;

    std::vector<std::string> roots;
    roots.push_back(base_root);
    roots.insert(roots.end(), overlays.begin(), overlays.end());

    // Validate every root before applying any of them
    std::vector<EnvMap> layers;
    for (const auto& root : roots) {
        auto loaded = load_root(root);
        if (loaded.isErr()) {
            return Result<EnvironmentContext>::err(loaded.error());
        }
        layers.push_back(std::move(loaded.value()));
    }

    for (size_t i = 0; i < layers.size(); ++i) {
        spdlog::debug("applying environment root {} ({} variables)", roots[i], layers[i].size());
        ctx.apply(layers[i]);
    }

    std::string overlay_list;
    for (const auto& overlay : overlays) {
        if (!overlay_list.empty()) overlay_list += get_path_separator();
        overlay_list += overlay;
    }
    ctx.table_["WSK_BASE_ROOT"] = base_root;
    ctx.assignments_["WSK_BASE_ROOT"] = base_root;
    ctx.table_["WSK_OVERLAY_ROOTS"] = overlay_list;
    ctx.assignments_["WSK_OVERLAY_ROOTS"] = overlay_list;

    return Result<EnvironmentContext>::ok(std::move(ctx));
}

Result<EnvironmentContext> EnvironmentContext::build(const std::string& base_root,
                                                     const std::vector<std::string>& overlays) {
    return build(base_root, overlays, to_env_table(get_all_env()));
}

EnvironmentContext EnvironmentContext::from_table(EnvTable table) {
    EnvironmentContext ctx;
    ctx.table_ = std::move(table);
    return ctx;
}

EnvironmentContext EnvironmentContext::with(const EnvMap& additions) const {
    EnvironmentContext derived = *this;
    derived.apply(additions);
    return derived;
}

void EnvironmentContext::apply(const EnvMap& vars) {
    for (const auto& [key, val] : vars) {
        auto result = apply_env_op(key, val, table_);
        if (result.has_value()) {
            table_[key] = *result;
            assignments_[key] = *result;
            removed_.erase(std::remove(removed_.begin(), removed_.end(), key), removed_.end());
        } else {
            table_.erase(key);
            assignments_.erase(key);
            if (std::find(removed_.begin(), removed_.end(), key) == removed_.end()) {
                removed_.push_back(key);
            }
        }
    }
}

std::optional<std::string> EnvironmentContext::get(const std::string& key) const {
    auto it = table_.find(key);
    if (it == table_.end()) return std::nullopt;
    return it->second;
}

bool EnvironmentContext::contains(const std::string& key) const {
    return table_.find(key) != table_.end();
}

std::vector<std::string> EnvironmentContext::to_envp() const {
    std::vector<std::string> envp;
    envp.reserve(table_.size());
    for (const auto& [key, value] : table_) {
        envp.push_back(key + "=" + value);
    }
    return envp;
}

} // namespace wsk

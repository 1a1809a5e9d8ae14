#pragma once

/**
 * @file environment.hpp
 * @brief Immutable execution environment built from a base root and overlays
 *
 * Every subprocess launched by the Runner sees exactly the table held by an
 * EnvironmentContext. The ambient process environment is captured once, when
 * the context is built, and is never consulted again afterwards.
 *
 * A root is a directory holding a `wsk_env.json` file:
 *
 *   {
 *     "environment": {
 *       "TOOLCHAIN_HOME": "/opt/toolchain",
 *       "PATH": { "op": "prepend", "value": "/opt/toolchain/bin" },
 *       "DEBUG_FLAGS": { "op": "unset" }
 *     }
 *   }
 */

#include "wsk/result.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wsk {

/// File that marks a directory as an environment root
constexpr const char* ENV_ROOT_FILE = "wsk_env.json";

// ============================================================================
// Environment Algebra
// ============================================================================

enum class EnvOp {
    Set,      ///< Replace/fill value
    Prepend,  ///< Prepend with separator
    Append,   ///< Append with separator
    Unset     ///< Remove variable
};

inline const char* env_op_to_string(EnvOp op) {
    switch (op) {
        case EnvOp::Set: return "set";
        case EnvOp::Prepend: return "prepend";
        case EnvOp::Append: return "append";
        case EnvOp::Unset: return "unset";
    }
    return "set";
}

std::optional<EnvOp> parse_env_op(const std::string& s);

struct EnvValue {
    EnvOp op = EnvOp::Set;
    std::string value;
    std::string separator = ":";

    EnvValue() = default;
    EnvValue(const char* v) : op(EnvOp::Set), value(v) {}
    EnvValue(const std::string& v) : op(EnvOp::Set), value(v) {}
    EnvValue(EnvOp o, const std::string& v, const std::string& sep = ":")
        : op(o), value(v), separator(sep) {}

    bool operator==(const EnvValue& other) const {
        return op == other.op && value == other.value && separator == other.separator;
    }
    bool operator!=(const EnvValue& other) const { return !(*this == other); }
};

/// Variables declared by one root, applied in key order
using EnvMap = std::map<std::string, EnvValue>;

/// Flattened KEY -> VALUE table
using EnvTable = std::map<std::string, std::string>;

// Apply one operation to the current table. Returns nullopt for unset.
std::optional<std::string> apply_env_op(const std::string& key,
                                        const EnvValue& env_val,
                                        const EnvTable& current);

// Parse the contents of a wsk_env.json file
ParseResult<EnvMap> parse_env_root_file(const std::string& json_str,
                                        const std::string& source_path = "");

// ============================================================================
// Environment Context
// ============================================================================

class EnvironmentContext {
public:
    EnvironmentContext() = default;

    /**
     * @brief Build a context from a base root and ordered overlays
     * @param base_root Directory containing wsk_env.json
     * @param overlays Roots applied after the base, later ones win
     * @param ambient Variables inherited when no root defines them
     * @return The context, or MISSING_ROOT if a root is absent or unreadable
     */
    static Result<EnvironmentContext> build(const std::string& base_root,
                                            const std::vector<std::string>& overlays,
                                            const EnvTable& ambient);

    /// Same as above, capturing the current process environment as ambient
    static Result<EnvironmentContext> build(const std::string& base_root,
                                            const std::vector<std::string>& overlays);

    /// Context with no roots; the table is used verbatim
    static EnvironmentContext from_table(EnvTable table);

    /// Derive a new context with extra operations applied on top
    EnvironmentContext with(const EnvMap& additions) const;

    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const;

    const EnvTable& table() const { return table_; }
    const std::string& base_root() const { return base_root_; }
    const std::vector<std::string>& overlays() const { return overlays_; }

    /// Final values of every variable a root (or addition) set or changed
    const EnvTable& assignments() const { return assignments_; }

    /// Variables a root removed
    const std::vector<std::string>& removed() const { return removed_; }

    /// KEY=VALUE strings for execve
    std::vector<std::string> to_envp() const;

private:
    void apply(const EnvMap& vars);

    std::string base_root_;
    std::vector<std::string> overlays_;
    EnvTable table_;
    EnvTable assignments_;
    std::vector<std::string> removed_;
};

/// Convert a process environment snapshot into an ordered table
EnvTable to_env_table(const std::unordered_map<std::string, std::string>& env);

} // namespace wsk

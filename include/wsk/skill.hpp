#pragma once

#include "wsk/environment.hpp"
#include "wsk/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace wsk {

// ============================================================================
// Output Classification
// ============================================================================

enum class ClassifierStream {
    Any,
    Stdout,
    Stderr,
};

std::optional<ClassifierStream> parse_classifier_stream(const std::string& s);

/**
 * One pattern rule. On a failing exit code the first matching rule names the
 * failure category ("lint violations found", "compiler error"). On a
 * successful exit code only rules with force_failure are considered, and a
 * match turns the run into a failure.
 *
 * Patterns are matched line by line over the last 64 KiB of a stream, and
 * only the first 1 KiB of each line is searched.
 */
struct ClassifierRule {
    std::string pattern;  // ECMAScript regular expression
    std::string category;
    ClassifierStream stream = ClassifierStream::Any;
    bool force_failure = false;
};

struct Classification {
    bool success = true;
    bool forced = false;  // success exit code overridden by a rule
    std::string category;
};

// ============================================================================
// Skill
// ============================================================================

/**
 * A named operation runnable against a package.
 *
 * Command templates are argv vectors; each element may contain placeholders:
 *   {package}       package name
 *   {package_path}  absolute package directory
 *   {workspace}     absolute workspace root
 *   {skill}         skill name
 *   {env:NAME}      value of NAME in the environment context (empty if unset)
 * Unknown placeholders are kept verbatim.
 */
struct Skill {
    std::string name;
    std::string description;
    std::vector<std::string> command;
    std::vector<std::string> requires_capabilities;  // empty means {name}
    std::vector<int> success_exit_codes{0};
    std::optional<std::chrono::milliseconds> timeout;
    EnvMap environment;                               // applied over the run context
    std::vector<ClassifierRule> classifiers;
    std::string working_directory = "{package_path}";

    std::vector<std::string> required_capabilities() const;
    bool applies_to(const Package& package) const;
    bool is_success_code(int exit_code) const;

    Classification classify(int exit_code,
                            const std::string& stdout_text,
                            const std::string& stderr_text) const;
};

// ============================================================================
// Template Expansion
// ============================================================================

struct TemplateVars {
    std::string package;
    std::string package_path;
    std::string workspace;
    std::string skill;
};

std::string expand_template(const std::string& tmpl,
                            const TemplateVars& vars,
                            const EnvironmentContext& env);

std::vector<std::string> expand_command(const Skill& skill,
                                        const TemplateVars& vars,
                                        const EnvironmentContext& env);

// Quote argv for display in a POSIX shell
std::string shell_join(const std::vector<std::string>& argv);

} // namespace wsk

#pragma once

#include "wsk/environment.hpp"
#include "wsk/skill.hpp"
#include "wsk/types.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace wsk {

struct RunnerOptions {
    std::string workspace_root;
    std::optional<std::chrono::milliseconds> timeout;  // used when the skill sets none
    std::chrono::milliseconds grace_period{2000};
    const std::atomic<bool>* cancel = nullptr;
};

// Concrete invocation for one package, before anything is launched
struct PreparedCommand {
    std::vector<std::string> argv;
    std::string working_directory;
    EnvironmentContext env;
};

/**
 * @brief Executes one skill against one package
 *
 * The subprocess sees the environment context's table plus the skill's own
 * additions and nothing else. The Runner never retries; retry policy belongs
 * to the caller.
 */
class Runner {
public:
    explicit Runner(RunnerOptions options);

    ExecutionOutcome execute(const Skill& skill,
                             const Package& package,
                             const EnvironmentContext& env) const;

    /// Expand the command template and working directory, apply skill environment
    PreparedCommand prepare(const Skill& skill,
                            const Package& package,
                            const EnvironmentContext& env) const;

    /// Absolute directory for a package
    std::string package_directory(const Package& package) const;

    /// Placeholder values for a package
    TemplateVars template_vars(const Skill& skill, const Package& package) const;

    const RunnerOptions& options() const { return options_; }

private:
    RunnerOptions options_;
};

} // namespace wsk

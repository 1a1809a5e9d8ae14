#include "wsk/runner.hpp"
#include "wsk/platform.hpp"
#include "wsk/subprocess.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace wsk {

Runner::Runner(RunnerOptions options) : options_(std::move(options)) {}

std::string Runner::package_directory(const Package& package) const {
    const std::string& rel = package.path.empty() ? package.name : package.path;
    return resolve_path(options_.workspace_root, rel);
}

TemplateVars Runner::template_vars(const Skill& skill, const Package& package) const {
    TemplateVars vars;
    vars.package = package.name;
    vars.package_path = package_directory(package);
    vars.workspace = options_.workspace_root;
    vars.skill = skill.name;
    return vars;
}

PreparedCommand Runner::prepare(const Skill& skill,
                                const Package& package,
                                const EnvironmentContext& env) const {
    PreparedCommand prepared;
    prepared.env = skill.environment.empty() ? env : env.with(skill.environment);
    TemplateVars vars = template_vars(skill, package);
    prepared.argv = expand_command(skill, vars, prepared.env);
    prepared.working_directory = resolve_path(
        options_.workspace_root, expand_template(skill.working_directory, vars, prepared.env));
    return prepared;
}

ExecutionOutcome Runner::execute(const Skill& skill,
                                 const Package& package,
                                 const EnvironmentContext& env) const {
    ExecutionOutcome outcome;
    outcome.package = package.name;
    outcome.skill = skill.name;
    outcome.attempts = 1;

    PreparedCommand prepared = prepare(skill, package, env);
    outcome.command = prepared.argv;
    outcome.working_directory = prepared.working_directory;

    SubprocessRequest request;
    request.argv = outcome.command;
    request.envp = prepared.env.to_envp();
    request.cwd = outcome.working_directory;
    request.timeout = skill.timeout ? skill.timeout : options_.timeout;
    request.grace_period = options_.grace_period;
    request.cancel = options_.cancel;

    spdlog::debug("[{}] {} in {}", package.name, shell_join(outcome.command),
                  outcome.working_directory);

    SubprocessResult proc = run_subprocess(request);

    outcome.duration = proc.duration;
    outcome.stdout_text = std::move(proc.stdout_text);
    outcome.stderr_text = std::move(proc.stderr_text);
    outcome.output = std::move(proc.output);

    if (!proc.started) {
        outcome.kind = OutcomeKind::Failure;
        outcome.reason = FailureReason::SpawnError;
        outcome.detail = proc.error;
        spdlog::warn("[{}] {} could not start: {}", package.name, skill.name, proc.error);
        return outcome;
    }

    outcome.exit_code = proc.exit_code;

    if (proc.cancelled) {
        outcome.kind = OutcomeKind::Failure;
        outcome.reason = FailureReason::Cancelled;
        outcome.detail = "cancelled";
        return outcome;
    }

    if (proc.timed_out) {
        outcome.kind = OutcomeKind::Failure;
        outcome.reason = FailureReason::Timeout;
        outcome.detail = "timed out after " + std::to_string(request.timeout->count()) + "ms";
        return outcome;
    }

    Classification cls = skill.classify(proc.exit_code, outcome.stdout_text, outcome.stderr_text);
    outcome.category = cls.category;
    if (cls.success) {
        outcome.kind = OutcomeKind::Success;
        outcome.reason = FailureReason::None;
    } else if (cls.forced) {
        outcome.kind = OutcomeKind::Failure;
        outcome.reason = FailureReason::Classified;
        outcome.detail = cls.category;
    } else {
        outcome.kind = OutcomeKind::Failure;
        outcome.reason = FailureReason::NonZeroExit;
        outcome.detail = "exit code " + std::to_string(proc.exit_code);
        if (!cls.category.empty()) {
            outcome.detail += " (" + cls.category + ")";
        }
    }

    return outcome;
}

} // namespace wsk

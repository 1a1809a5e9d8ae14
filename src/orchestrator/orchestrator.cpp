#include "wsk/orchestrator.hpp"
#include "wsk/platform.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <functional>
#include <map>
#include <thread>

#include <spdlog/spdlog.h>

namespace wsk {

// ============================================================================
// Options
// ============================================================================

bool RetryPolicy::should_retry(const ExecutionOutcome& outcome, int attempt) const {
    if (attempt >= max_attempts) return false;
    if (outcome.kind != OutcomeKind::Failure) return false;

    switch (outcome.reason) {
        case FailureReason::Timeout:
            return true;
        case FailureReason::NonZeroExit:
        case FailureReason::Classified:
            return !only_timeouts;
        case FailureReason::None:
        case FailureReason::SpawnError:
        case FailureReason::Cancelled:
            return false;
    }
    return false;
}

size_t effective_concurrency(size_t requested) {
    if (requested > 0) return requested;
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

const PlannedStep* ExecutionPlan::find(const std::string& package) const {
    for (const auto& step : steps) {
        if (step.package == package) return &step;
    }
    return nullptr;
}

size_t ExecutionPlan::runnable_count() const {
    return static_cast<size_t>(std::count_if(steps.begin(), steps.end(),
        [](const PlannedStep& s) { return s.applicable; }));
}

// ============================================================================
// Execution State
// ============================================================================

// Shared between workers; every field is guarded by mutex
struct Orchestrator::Execution {
    std::mutex mutex;
    std::condition_variable cv;

    // Append-only accumulator
    std::vector<ExecutionOutcome> outcomes;
    std::map<std::string, size_t> outcome_index;

    std::vector<std::vector<size_t>> waits_on;  // applicable dependencies, seen through unsupported ones
    std::vector<size_t> pending;                // unfinished entries of waits_on
    std::vector<std::vector<size_t>> dependents;
    std::set<size_t> ready;       // step indices, lowest first
    size_t remaining = 0;         // applicable steps not yet terminal

    // Progress callbacks run outside mutex, one at a time
    std::mutex callback_mutex;

    void report(const ProgressCallback& callback, const ExecutionOutcome& outcome) {
        if (!callback) return;
        std::lock_guard<std::mutex> lock(callback_mutex);
        try {
            callback(outcome);
        } catch (const std::exception& e) {
            spdlog::error("[{}] progress callback failed: {}", outcome.package, e.what());
        }
    }

    const ExecutionOutcome* find(const std::string& package) const {
        auto it = outcome_index.find(package);
        return it == outcome_index.end() ? nullptr : &outcomes[it->second];
    }
};

namespace {

std::vector<std::string> missing_capabilities(const Skill& skill, const Package& package) {
    std::vector<std::string> missing;
    for (const auto& capability : skill.required_capabilities()) {
        if (!package.has_capability(capability)) {
            missing.push_back(capability);
        }
    }
    return missing;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

ExecutionOutcome make_skipped(const PlannedStep& step, const std::string& skill,
                              OutcomeKind kind, std::string detail) {
    ExecutionOutcome outcome;
    outcome.package = step.package;
    outcome.skill = skill;
    outcome.kind = kind;
    outcome.reason = FailureReason::None;
    outcome.detail = std::move(detail);
    outcome.command = step.command;
    outcome.working_directory = step.working_directory;
    return outcome;
}

} // namespace

// ============================================================================
// Orchestrator
// ============================================================================

Orchestrator::Orchestrator(const PackageGraph& graph,
                           const SkillRegistry& registry,
                           EnvironmentContext env,
                           std::string workspace_root)
    : graph_(graph),
      registry_(registry),
      env_(std::move(env)),
      workspace_root_(std::move(workspace_root)) {}

void Orchestrator::cancel() {
    if (!cancel_.exchange(true)) {
        spdlog::info("cancellation requested");
    }
}

Result<ExecutionPlan> Orchestrator::plan(const std::string& skill_name,
                                         const std::set<std::string>& targets,
                                         const RunOptions& options) const {
    auto resolved = registry_.resolve(skill_name);
    if (resolved.isErr()) {
        return Result<ExecutionPlan>::err(resolved.error());
    }
    const Skill& skill = *resolved.value();

    Result<std::vector<std::string>> order = Result<std::vector<std::string>>::ok({});
    if (options.only_affected) {
        auto affected = graph_.affected_by(targets);
        if (affected.isErr()) {
            return Result<ExecutionPlan>::err(affected.error());
        }
        order = graph_.order_subset(affected.value());
    } else {
        order = graph_.topological_order(targets);
    }
    if (order.isErr()) {
        return Result<ExecutionPlan>::err(order.error());
    }

    ExecutionPlan plan;
    plan.skill = skill.name;
    plan.description = skill.description;
    plan.targets.assign(targets.begin(), targets.end());
    plan.only_affected = options.only_affected;
    plan.workspace_root = workspace_root_;
    plan.base_root = env_.base_root();
    plan.overlays = env_.overlays();
    plan.timeout = skill.timeout ? skill.timeout : options.timeout;
    plan.created_at = get_current_timestamp();

    Runner runner(RunnerOptions{workspace_root_, options.timeout, options.grace_period, nullptr});
    std::set<std::string> scheduled(order.value().begin(), order.value().end());

    bool have_env = false;
    for (const auto& name : order.value()) {
        const Package* pkg = graph_.find(name);

        PlannedStep step;
        step.package = name;
        step.package_path = runner.package_directory(*pkg);
        for (const auto& dep : graph_.dependencies_of(name)) {
            if (scheduled.count(dep)) {
                step.dependencies.push_back(dep);
            }
        }

        if (!skill.applies_to(*pkg)) {
            step.applicable = false;
            step.skip_reason = "package does not declare capability " +
                               join(missing_capabilities(skill, *pkg), ", ");
        }

        PreparedCommand prepared = runner.prepare(skill, *pkg, env_);
        step.command = std::move(prepared.argv);
        step.working_directory = std::move(prepared.working_directory);
        if (!have_env) {
            plan.environment = prepared.env.assignments();
            plan.unset = prepared.env.removed();
            have_env = true;
        }

        plan.steps.push_back(std::move(step));
    }
    if (!have_env) {
        EnvironmentContext run_env = env_.with(skill.environment);
        plan.environment = run_env.assignments();
        plan.unset = run_env.removed();
    }

    spdlog::debug("planned {} for {} packages ({} runnable)", skill.name, plan.steps.size(),
                  plan.runnable_count());
    return Result<ExecutionPlan>::ok(std::move(plan));
}

Result<RunSummary> Orchestrator::run(const std::string& skill_name,
                                     const std::set<std::string>& targets,
                                     const RunOptions& options) {
    OrchestratorState expected = OrchestratorState::Idle;
    if (!state_.compare_exchange_strong(expected, OrchestratorState::Planning)) {
        return Result<RunSummary>::err(Error(ErrorCode::INVALID_STATE,
            "orchestrator already used (state: " +
            std::string(orchestrator_state_to_string(expected)) + ")"));
    }

    RunSummary summary;
    summary.skill = skill_name;
    summary.targets.assign(targets.begin(), targets.end());
    summary.started_at = get_current_timestamp();
    auto started = std::chrono::steady_clock::now();

    // Planning
    auto planned = plan(skill_name, targets, options);
    if (planned.isErr()) {
        state_ = OrchestratorState::Done;
        return Result<RunSummary>::err(planned.error());
    }
    last_plan_ = std::move(planned.value());
    const ExecutionPlan& exec_plan = *last_plan_;
    const Skill& skill = *registry_.resolve(skill_name).value();

    // Executing
    state_ = OrchestratorState::Executing;
    Execution exec;
    execute_plan(skill, exec_plan, options, exec);

    // Aggregating
    state_ = OrchestratorState::Aggregating;
    bool any_success = false;
    for (const auto& step : exec_plan.steps) {
        const ExecutionOutcome* outcome = exec.find(step.package);
        if (!outcome) {
            // Unreachable unless a worker died; keep the package visible
            summary.outcomes.push_back(make_skipped(step, skill.name, OutcomeKind::SkippedCancelled,
                                                    "not scheduled"));
            outcome = &summary.outcomes.back();
        } else {
            summary.outcomes.push_back(*outcome);
        }

        if (outcome->kind == OutcomeKind::Failure) {
            summary.failed.push_back(outcome->package);
        } else if (outcome->kind == OutcomeKind::Success) {
            any_success = true;
        } else {
            summary.skipped.push_back({outcome->package, outcome->kind, outcome->detail});
        }
    }

    if (cancel_requested()) {
        summary.status = RunStatus::Cancelled;
    } else if (!summary.failed.empty()) {
        summary.status = RunStatus::Failure;
    } else if (any_success) {
        summary.status = RunStatus::Success;
    } else {
        summary.status = RunStatus::NoOp;
    }

    summary.finished_at = get_current_timestamp();
    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    spdlog::info("{}: {} ({} outcomes, {} failed, {} skipped)", skill.name,
                 run_status_to_string(summary.status), summary.outcomes.size(),
                 summary.failed.size(), summary.skipped.size());

    state_ = OrchestratorState::Done;
    return Result<RunSummary>::ok(std::move(summary));
}

void Orchestrator::execute_plan(const Skill& skill, const ExecutionPlan& plan,
                                const RunOptions& options, Execution& exec) {
    const size_t n = plan.steps.size();
    std::map<std::string, size_t> index;
    for (size_t i = 0; i < n; ++i) {
        index[plan.steps[i].package] = i;
    }

    exec.waits_on.assign(n, {});
    exec.pending.assign(n, 0);
    exec.dependents.assign(n, {});

    // Unsupported packages never run, so a step waits on whatever they wait on
    std::function<void(size_t, std::set<size_t>&, std::set<size_t>&)> collect =
        [&](size_t step, std::set<size_t>& found, std::set<size_t>& seen) {
            for (const auto& dep : plan.steps[step].dependencies) {
                size_t d = index.at(dep);
                if (!seen.insert(d).second) continue;
                if (plan.steps[d].applicable) {
                    found.insert(d);
                } else {
                    collect(d, found, seen);
                }
            }
        };

    // Non-applicable packages are terminal before anything runs
    for (size_t i = 0; i < n; ++i) {
        const PlannedStep& step = plan.steps[i];
        if (!step.applicable) {
            exec.outcome_index[step.package] = exec.outcomes.size();
            exec.outcomes.push_back(make_skipped(step, skill.name, OutcomeKind::SkippedUnsupported,
                                                 step.skip_reason));
            exec.report(options.on_outcome, exec.outcomes.back());
            continue;
        }
        ++exec.remaining;
        std::set<size_t> found;
        std::set<size_t> seen;
        collect(i, found, seen);
        for (size_t d : found) {
            exec.waits_on[i].push_back(d);
            exec.dependents[d].push_back(i);
        }
        exec.pending[i] = found.size();
    }
    for (size_t i = 0; i < n; ++i) {
        if (plan.steps[i].applicable && exec.pending[i] == 0) {
            exec.ready.insert(i);
        }
    }

    if (exec.remaining == 0) return;

    Runner runner(RunnerOptions{workspace_root_, options.timeout, options.grace_period, &cancel_});
    size_t workers = std::min(effective_concurrency(options.concurrency), exec.remaining);
    spdlog::debug("executing {} packages on {} workers", exec.remaining, workers);

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&]() { worker_loop(skill, plan, options, runner, exec); });
    }
    for (auto& t : threads) {
        t.join();
    }
}

void Orchestrator::worker_loop(const Skill& skill, const ExecutionPlan& plan,
                               const RunOptions& options, const Runner& runner, Execution& exec) {
    std::unique_lock<std::mutex> lock(exec.mutex);

    while (true) {
        exec.cv.wait(lock, [&]() { return !exec.ready.empty() || exec.remaining == 0; });
        if (exec.ready.empty()) return;

        size_t idx = *exec.ready.begin();
        exec.ready.erase(exec.ready.begin());
        const PlannedStep& step = plan.steps[idx];

        std::string blocker;
        for (size_t d : exec.waits_on[idx]) {
            const ExecutionOutcome* dep_outcome = exec.find(plan.steps[d].package);
            if (dep_outcome && (dep_outcome->kind == OutcomeKind::Failure ||
                                dep_outcome->kind == OutcomeKind::SkippedUpstreamFailure)) {
                blocker = dep_outcome->package;
                break;
            }
        }

        ExecutionOutcome outcome;
        if (cancel_requested()) {
            outcome = make_skipped(step, skill.name, OutcomeKind::SkippedCancelled,
                                   "run cancelled before start");
        } else if (!blocker.empty()) {
            outcome = make_skipped(step, skill.name, OutcomeKind::SkippedUpstreamFailure,
                                   "dependency " + blocker + " did not succeed");
        } else {
            lock.unlock();
            outcome = run_with_retry(skill, *graph_.find(step.package), options, runner);
            lock.lock();
        }

        exec.outcome_index[step.package] = exec.outcomes.size();
        exec.outcomes.push_back(outcome);

        --exec.remaining;
        for (size_t d : exec.dependents[idx]) {
            if (--exec.pending[d] == 0) {
                exec.ready.insert(d);
            }
        }
        exec.cv.notify_all();

        if (options.on_outcome) {
            lock.unlock();
            exec.report(options.on_outcome, outcome);
            lock.lock();
        }
    }
}

ExecutionOutcome Orchestrator::run_with_retry(const Skill& skill, const Package& package,
                                              const RunOptions& options,
                                              const Runner& runner) const {
    int attempt = 1;
    ExecutionOutcome outcome = runner.execute(skill, package, env_);
    while (!cancel_requested() && options.retry.should_retry(outcome, attempt)) {
        spdlog::info("[{}] {} failed ({}), retrying (attempt {}/{})", package.name, skill.name,
                     failure_reason_to_string(outcome.reason), attempt + 1,
                     options.retry.max_attempts);
        ++attempt;
        outcome = runner.execute(skill, package, env_);
    }
    outcome.attempts = attempt;
    return outcome;
}

} // namespace wsk

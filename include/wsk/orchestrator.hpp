#pragma once

/**
 * @file orchestrator.hpp
 * @brief Runs one skill across a target set of packages
 *
 * One Orchestrator serves exactly one invocation:
 *
 *   Planning -> Executing -> Aggregating -> Done
 *
 * Planning rejects unknown skills and targets before anything runs.
 * Executing launches packages on a bounded pool of workers once their
 * dependencies are terminal. A package whose direct dependency failed (or was
 * itself skipped for that reason) is recorded as skipped-upstream-failure.
 * Dependencies that do not support the skill are looked through: the package
 * waits on, and is blocked by, their own dependencies instead.
 * Execution failures never stop unrelated packages.
 */

#include "wsk/environment.hpp"
#include "wsk/package_graph.hpp"
#include "wsk/result.hpp"
#include "wsk/runner.hpp"
#include "wsk/skill_registry.hpp"
#include "wsk/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace wsk {

enum class OrchestratorState {
    Idle,
    Planning,
    Executing,
    Aggregating,
    Done,
};

inline const char* orchestrator_state_to_string(OrchestratorState s) {
    switch (s) {
        case OrchestratorState::Idle: return "idle";
        case OrchestratorState::Planning: return "planning";
        case OrchestratorState::Executing: return "executing";
        case OrchestratorState::Aggregating: return "aggregating";
        case OrchestratorState::Done: return "done";
    }
    return "idle";
}

// ============================================================================
// Options
// ============================================================================

/**
 * Caller-supplied retry policy. The Runner itself never retries.
 * max_attempts counts the first attempt, so 1 disables retries.
 */
struct RetryPolicy {
    int max_attempts = 1;
    bool only_timeouts = false;

    bool should_retry(const ExecutionOutcome& outcome, int attempt) const;
};

// Invoked once per outcome, serialized, in completion order. Runs on a worker
// thread without holding the scheduler lock; exceptions are logged and dropped.
using ProgressCallback = std::function<void(const ExecutionOutcome&)>;

struct RunOptions {
    size_t concurrency = 0;  // 0 selects hardware_concurrency
    std::optional<std::chrono::milliseconds> timeout;
    std::chrono::milliseconds grace_period{2000};
    bool only_affected = false;  // targets are the changed set
    RetryPolicy retry;
    ProgressCallback on_outcome;
};

// Concurrency actually used for a requested value
size_t effective_concurrency(size_t requested);

// ============================================================================
// Plan
// ============================================================================

struct PlannedStep {
    std::string package;
    std::string package_path;  // absolute
    std::vector<std::string> dependencies;  // inside the scheduled set
    bool applicable = true;
    std::string skip_reason;
    std::vector<std::string> command;
    std::string working_directory;
};

struct ExecutionPlan {
    std::string skill;
    std::string description;
    std::vector<std::string> targets;
    bool only_affected = false;
    std::vector<PlannedStep> steps;  // dependency-first
    std::string workspace_root;
    std::string base_root;
    std::vector<std::string> overlays;
    EnvTable environment;              // variables the roots and the skill define
    std::vector<std::string> unset;    // variables the roots remove
    std::optional<std::chrono::milliseconds> timeout;
    std::string created_at;

    const PlannedStep* find(const std::string& package) const;
    size_t runnable_count() const;
};

// ============================================================================
// Orchestrator
// ============================================================================

class Orchestrator {
public:
    /**
     * The graph and registry must outlive the Orchestrator. Neither is
     * modified; both are read concurrently by the workers.
     */
    Orchestrator(const PackageGraph& graph,
                 const SkillRegistry& registry,
                 EnvironmentContext env,
                 std::string workspace_root);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Plan without executing
     * @return UNKNOWN_SKILL or UNKNOWN_PACKAGE on bad input
     */
    Result<ExecutionPlan> plan(const std::string& skill_name,
                               const std::set<std::string>& targets,
                               const RunOptions& options = {}) const;

    /**
     * @brief Plan, execute and aggregate
     * @return The summary, a configuration error from Planning, or
     *         INVALID_STATE when this instance already ran
     */
    Result<RunSummary> run(const std::string& skill_name,
                           const std::set<std::string>& targets,
                           const RunOptions& options = {});

    /// Thread-safe. Running subprocesses are terminated, unstarted packages skipped.
    void cancel();
    bool cancel_requested() const { return cancel_.load(); }

    OrchestratorState state() const { return state_.load(); }

    /// Plan of the last run; empty before Planning completes
    const std::optional<ExecutionPlan>& last_plan() const { return last_plan_; }

private:
    struct Execution;

    void execute_plan(const Skill& skill, const ExecutionPlan& plan,
                      const RunOptions& options, Execution& exec);
    void worker_loop(const Skill& skill, const ExecutionPlan& plan,
                     const RunOptions& options, const Runner& runner, Execution& exec);
    ExecutionOutcome run_with_retry(const Skill& skill, const Package& package,
                                    const RunOptions& options, const Runner& runner) const;

    const PackageGraph& graph_;
    const SkillRegistry& registry_;
    EnvironmentContext env_;
    std::string workspace_root_;

    std::atomic<OrchestratorState> state_{OrchestratorState::Idle};
    std::atomic<bool> cancel_{false};
    std::optional<ExecutionPlan> last_plan_;
};

} // namespace wsk

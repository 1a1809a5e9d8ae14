#pragma once

/**
 * @file workspace.hpp
 * @brief Main wsk library interface
 *
 * A Workspace ties the workspace file to the orchestration core. Manifests,
 * the skill catalog and the environment roots are read again for every
 * plan or run, so edits between calls are always picked up, and each run
 * gets a fresh Orchestrator.
 *
 * @example
 * ```cpp
 * auto ws = wsk::Workspace::open("wsk.json");
 * if (ws.isOk()) {
 *     auto report = ws.value()->run("test", {"core"});
 * }
 * ```
 */

#include "wsk/artifacts.hpp"
#include "wsk/environment.hpp"
#include "wsk/orchestrator.hpp"
#include "wsk/package_graph.hpp"
#include "wsk/result.hpp"
#include "wsk/skill_registry.hpp"
#include "wsk/workspace_config.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace wsk {

/// Everything loaded from disk for one invocation
struct WorkspaceSnapshot {
    PackageGraph graph;
    SkillRegistry registry;
    EnvironmentContext env;
};

struct RunReport {
    RunSummary summary;
    ExecutionPlan plan;
    std::vector<std::string> artifacts;  // files written, if any
    std::string artifact_error;          // set when writing artifacts failed
};

class Workspace {
public:
    static std::unique_ptr<Workspace> create(WorkspaceConfig config);

    /// Load the workspace file; FILE_NOT_FOUND or INVALID_CONFIG
    static Result<std::unique_ptr<Workspace>> open(const std::string& config_path);

    const WorkspaceConfig& config() const { return config_; }

    /// Run options seeded from the workspace defaults
    RunOptions default_run_options() const;

    Result<PackageGraph> load_graph() const;
    Result<SkillRegistry> load_skills() const;
    Result<EnvironmentContext> load_environment() const;

    /// Graph, skills and environment, validated together
    Result<WorkspaceSnapshot> load() const;

    /// An empty target set selects every package
    Result<ExecutionPlan> plan(const std::string& skill,
                               const std::set<std::string>& targets,
                               const RunOptions& options) const;

    /**
     * @brief Run a skill and write artifacts when artifacts_dir is set
     *
     * An empty target set selects every package. Configuration errors are
     * returned before anything executes.
     */
    Result<RunReport> run(const std::string& skill,
                          const std::set<std::string>& targets,
                          const RunOptions& options);

    /// Thread-safe; cancels the active run and any run started afterwards
    void cancel();

private:
    explicit Workspace(WorkspaceConfig config);

    WorkspaceConfig config_;
    std::atomic<bool> cancelled_{false};
    std::mutex active_mutex_;
    Orchestrator* active_ = nullptr;
};

} // namespace wsk

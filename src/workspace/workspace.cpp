#include "wsk/workspace.hpp"
#include "wsk/manifest.hpp"

#include <spdlog/spdlog.h>

namespace wsk {

namespace {

std::set<std::string> select_targets(const PackageGraph& graph,
                                     const std::set<std::string>& targets) {
    if (!targets.empty()) return targets;
    auto names = graph.names();
    return std::set<std::string>(names.begin(), names.end());
}

} // namespace

Workspace::Workspace(WorkspaceConfig config) : config_(std::move(config)) {}

std::unique_ptr<Workspace> Workspace::create(WorkspaceConfig config) {
    return std::unique_ptr<Workspace>(new Workspace(std::move(config)));
}

Result<std::unique_ptr<Workspace>> Workspace::open(const std::string& config_path) {
    auto config = load_workspace_config(config_path);
    if (config.isErr()) {
        return Result<std::unique_ptr<Workspace>>::err(config.error());
    }
    return Result<std::unique_ptr<Workspace>>::ok(create(std::move(config.value())));
}

RunOptions Workspace::default_run_options() const {
    RunOptions options;
    options.concurrency = config_.defaults.concurrency;
    options.timeout = config_.defaults.timeout;
    options.grace_period = config_.defaults.grace_period;
    options.retry.max_attempts = config_.defaults.max_attempts;
    options.retry.only_timeouts = config_.defaults.retry_only_timeouts;
    return options;
}

Result<PackageGraph> Workspace::load_graph() const {
    auto packages = load_manifests(config_.manifests, config_.root);
    if (packages.isErr()) {
        return Result<PackageGraph>::err(packages.error());
    }
    return PackageGraph::load(std::move(packages.value()));
}

Result<SkillRegistry> Workspace::load_skills() const {
    auto skills = load_skill_catalog(config_.skills);
    if (skills.isErr()) {
        return Result<SkillRegistry>::err(skills.error());
    }
    return SkillRegistry::from_skills(std::move(skills.value()));
}

Result<EnvironmentContext> Workspace::load_environment() const {
    return EnvironmentContext::build(config_.base_root, config_.overlays);
}

Result<WorkspaceSnapshot> Workspace::load() const {
    auto graph = load_graph();
    if (graph.isErr()) {
        return Result<WorkspaceSnapshot>::err(graph.error());
    }
    auto registry = load_skills();
    if (registry.isErr()) {
        return Result<WorkspaceSnapshot>::err(registry.error());
    }
    auto env = load_environment();
    if (env.isErr()) {
        return Result<WorkspaceSnapshot>::err(env.error());
    }

    WorkspaceSnapshot snapshot{std::move(graph.value()), std::move(registry.value()),
                               std::move(env.value())};
    spdlog::debug("workspace {}: {} packages, {} skills", config_.root, snapshot.graph.size(),
                  snapshot.registry.size());
    return Result<WorkspaceSnapshot>::ok(std::move(snapshot));
}

Result<ExecutionPlan> Workspace::plan(const std::string& skill,
                                      const std::set<std::string>& targets,
                                      const RunOptions& options) const {
    auto snapshot = load();
    if (snapshot.isErr()) {
        return Result<ExecutionPlan>::err(snapshot.error());
    }
    const auto& s = snapshot.value();

    Orchestrator orchestrator(s.graph, s.registry, s.env, config_.root);
    return orchestrator.plan(skill, select_targets(s.graph, targets), options);
}

Result<RunReport> Workspace::run(const std::string& skill,
                                 const std::set<std::string>& targets,
                                 const RunOptions& options) {
    auto snapshot = load();
    if (snapshot.isErr()) {
        return Result<RunReport>::err(snapshot.error());
    }
    const auto& s = snapshot.value();

    Orchestrator orchestrator(s.graph, s.registry, s.env, config_.root);
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        active_ = &orchestrator;
        if (cancelled_.load()) orchestrator.cancel();
    }

    auto summary = orchestrator.run(skill, select_targets(s.graph, targets), options);

    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        active_ = nullptr;
    }

    if (summary.isErr()) {
        return Result<RunReport>::err(summary.error());
    }

    RunReport report;
    report.summary = std::move(summary.value());
    report.plan = *orchestrator.last_plan();

    if (!config_.artifacts_dir.empty()) {
        auto written = write_artifacts(config_.artifacts_dir, report.plan, &report.summary);
        if (written.isOk()) {
            report.artifacts = std::move(written.value());
        } else {
            report.artifact_error = written.error().toString();
            spdlog::error("writing artifacts failed: {}", report.artifact_error);
        }
    }

    return Result<RunReport>::ok(std::move(report));
}

void Workspace::cancel() {
    cancelled_ = true;
    std::lock_guard<std::mutex> lock(active_mutex_);
    if (active_) {
        active_->cancel();
    }
}

} // namespace wsk

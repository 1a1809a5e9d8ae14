#include "wsk/artifacts.hpp"
#include "wsk/platform.hpp"
#include "wsk/skill.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace wsk {

namespace {

using json = nlohmann::json;

std::string shell_quote(const std::string& value) {
    return shell_join({value});
}

std::string step_command_line(const PlannedStep& step) {
    return "cd " + shell_quote(step.working_directory) + " && " + shell_join(step.command);
}

const char* stream_name(OutputStream s) {
    return s == OutputStream::Stdout ? "stdout" : "stderr";
}

} // namespace

std::string dump_json(const nlohmann::json& j) {
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

// ============================================================================
// Outcomes and Summary
// ============================================================================

json outcome_to_json(const ExecutionOutcome& outcome, bool include_output) {
    json j;
    j["package"] = outcome.package;
    j["skill"] = outcome.skill;
    j["outcome"] = outcome_kind_to_string(outcome.kind);
    j["reason"] = failure_reason_to_string(outcome.reason);
    j["exit_code"] = outcome.exit_code ? json(*outcome.exit_code) : json(nullptr);
    if (!outcome.category.empty()) j["category"] = outcome.category;
    if (!outcome.detail.empty()) j["detail"] = outcome.detail;
    j["command"] = outcome.command;
    j["working_directory"] = outcome.working_directory;
    j["duration_ms"] = outcome.duration.count();
    j["attempts"] = outcome.attempts;

    if (include_output) {
        j["stdout"] = outcome.stdout_text;
        j["stderr"] = outcome.stderr_text;
        json chunks = json::array();
        for (const auto& chunk : outcome.output) {
            chunks.push_back({{"stream", stream_name(chunk.stream)}, {"text", chunk.text}});
        }
        j["output"] = chunks;
    }
    return j;
}

json summary_to_json(const RunSummary& summary, bool include_output) {
    json j;
    j["$schema"] = SUMMARY_SCHEMA;
    j["skill"] = summary.skill;
    j["status"] = run_status_to_string(summary.status);
    j["targets"] = summary.targets;
    j["started_at"] = summary.started_at;
    j["finished_at"] = summary.finished_at;
    j["duration_ms"] = summary.duration.count();
    j["failed"] = summary.failed;

    json skipped = json::array();
    for (const auto& s : summary.skipped) {
        skipped.push_back({{"package", s.package},
                           {"outcome", outcome_kind_to_string(s.kind)},
                           {"reason", s.reason}});
    }
    j["skipped"] = skipped;

    json outcomes = json::array();
    for (const auto& o : summary.outcomes) {
        outcomes.push_back(outcome_to_json(o, include_output));
    }
    j["outcomes"] = outcomes;
    return j;
}

// ============================================================================
// Implementation Plan
// ============================================================================

json plan_to_json(const ExecutionPlan& plan) {
    json j;
    j["$schema"] = PLAN_SCHEMA;
    j["skill"] = plan.skill;
    if (!plan.description.empty()) j["description"] = plan.description;
    j["targets"] = plan.targets;
    j["only_affected"] = plan.only_affected;
    j["workspace"] = plan.workspace_root;
    j["created_at"] = plan.created_at;

    json env;
    env["base_root"] = plan.base_root;
    env["overlays"] = plan.overlays;
    j["environment"] = env;

    json steps = json::array();
    size_t order = 0;
    for (const auto& step : plan.steps) {
        json s;
        s["order"] = ++order;
        s["package"] = step.package;
        s["path"] = step.package_path;
        s["dependencies"] = step.dependencies;
        s["action"] = step.applicable ? "run" : "skip";
        if (!step.applicable) s["reason"] = step.skip_reason;
        steps.push_back(s);
    }
    j["steps"] = steps;
    j["affected"] = json::array();
    for (const auto& step : plan.steps) {
        j["affected"].push_back(step.package);
    }
    return j;
}

std::string plan_to_markdown(const ExecutionPlan& plan) {
    std::ostringstream out;
    out << "# Implementation plan: " << plan.skill << "\n\n";
    if (!plan.description.empty()) {
        out << plan.description << "\n\n";
    }
    out << "- Workspace: `" << plan.workspace_root << "`\n";
    out << "- Targets: ";
    if (plan.targets.empty()) {
        out << "(none)";
    }
    for (size_t i = 0; i < plan.targets.size(); ++i) {
        out << (i > 0 ? ", " : "") << "`" << plan.targets[i] << "`";
    }
    out << "\n";
    if (plan.only_affected) {
        out << "- Scope: packages affected by the targets\n";
    }
    out << "- Environment base root: `" << plan.base_root << "`\n";
    for (const auto& overlay : plan.overlays) {
        out << "- Overlay: `" << overlay << "`\n";
    }
    out << "- Created: " << plan.created_at << "\n\n";

    out << "| # | Package | Depends on | Action |\n";
    out << "|---|---------|------------|--------|\n";
    size_t order = 0;
    for (const auto& step : plan.steps) {
        out << "| " << ++order << " | " << step.package << " | ";
        for (size_t i = 0; i < step.dependencies.size(); ++i) {
            out << (i > 0 ? ", " : "") << step.dependencies[i];
        }
        out << " | " << (step.applicable ? "run" : "skip: " + step.skip_reason) << " |\n";
    }
    if (plan.steps.empty()) {
        out << "\nNothing to do.\n";
    }
    return out.str();
}

// ============================================================================
// Verification Walkthrough
// ============================================================================

std::vector<std::string> environment_exports(const ExecutionPlan& plan) {
    std::vector<std::string> lines;
    for (const auto& [key, value] : plan.environment) {
        lines.push_back("export " + key + "=" + shell_quote(value));
    }
    for (const auto& key : plan.unset) {
        lines.push_back("unset " + key);
    }
    return lines;
}

json walkthrough_to_json(const ExecutionPlan& plan, const RunSummary* summary) {
    json j;
    j["$schema"] = WALKTHROUGH_SCHEMA;
    j["skill"] = plan.skill;
    j["workspace"] = plan.workspace_root;
    j["environment"] = environment_exports(plan);
    if (summary) {
        j["status"] = run_status_to_string(summary->status);
    }

    json steps = json::array();
    for (const auto& step : plan.steps) {
        if (!step.applicable) continue;
        json s;
        s["package"] = step.package;
        s["working_directory"] = step.working_directory;
        s["argv"] = step.command;
        s["command"] = step_command_line(step);
        if (summary) {
            if (const ExecutionOutcome* o = summary->find(step.package)) {
                s["observed"] = outcome_kind_to_string(o->kind);
                s["exit_code"] = o->exit_code ? json(*o->exit_code) : json(nullptr);
                if (!o->detail.empty()) s["detail"] = o->detail;
            }
        }
        steps.push_back(s);
    }
    j["steps"] = steps;
    return j;
}

std::string walkthrough_to_markdown(const ExecutionPlan& plan, const RunSummary* summary) {
    std::ostringstream out;
    out << "# Verification walkthrough: " << plan.skill << "\n\n";
    if (summary) {
        out << "Result: **" << run_status_to_string(summary->status) << "**\n\n";
    }

    auto exports = environment_exports(plan);
    if (!exports.empty()) {
        out << "Environment:\n\n```sh\n";
        for (const auto& line : exports) {
            out << line << "\n";
        }
        out << "```\n\n";
    }

    size_t order = 0;
    for (const auto& step : plan.steps) {
        if (!step.applicable) continue;
        out << "## " << ++order << ". " << step.package << "\n\n";
        out << "```sh\n" << step_command_line(step) << "\n```\n\n";
        if (summary) {
            if (const ExecutionOutcome* o = summary->find(step.package)) {
                out << "Observed: " << outcome_kind_to_string(o->kind);
                if (o->exit_code) out << " (exit " << *o->exit_code << ")";
                if (!o->detail.empty()) out << ", " << o->detail;
                out << "\n\n";
            }
        }
    }
    if (order == 0) {
        out << "No commands to run.\n";
    }
    return out.str();
}

// ============================================================================
// Writing
// ============================================================================

Result<std::vector<std::string>> write_artifacts(const std::string& dir,
                                                 const ExecutionPlan& plan,
                                                 const RunSummary* summary) {
    if (!create_directories(dir)) {
        return Result<std::vector<std::string>>::err(Error(ErrorCode::IO_ERROR,
            "cannot create artifacts directory: " + dir));
    }

    std::vector<std::pair<std::string, std::string>> files = {
        {"plan.json", dump_json(plan_to_json(plan)) + "\n"},
        {"plan.md", plan_to_markdown(plan)},
        {"walkthrough.json", dump_json(walkthrough_to_json(plan, summary)) + "\n"},
        {"walkthrough.md", walkthrough_to_markdown(plan, summary)},
    };
    if (summary) {
        files.push_back({"summary.json", dump_json(summary_to_json(*summary)) + "\n"});
    }

    std::vector<std::string> written;
    for (const auto& [name, content] : files) {
        std::string path = join_path(dir, name);
        auto result = atomic_write_file(path, content);
        if (!result.ok) {
            return Result<std::vector<std::string>>::err(Error(ErrorCode::IO_ERROR,
                result.error).withContext(path));
        }
        written.push_back(path);
    }

    spdlog::debug("wrote {} artifacts to {}", written.size(), dir);
    return Result<std::vector<std::string>>::ok(std::move(written));
}

} // namespace wsk

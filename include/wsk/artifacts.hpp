#pragma once

/**
 * @file artifacts.hpp
 * @brief Plan, walkthrough and summary documents
 *
 * The implementation plan records which packages a skill will touch and in
 * what order. The verification walkthrough lists the literal shell commands
 * (with working directory and environment) that reproduce each step, so a
 * human or another tool can re-run them. Both come as JSON and Markdown.
 */

#include "wsk/orchestrator.hpp"
#include "wsk/result.hpp"
#include "wsk/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace wsk {

constexpr const char* PLAN_SCHEMA = "wsk.plan.v1";
constexpr const char* WALKTHROUGH_SCHEMA = "wsk.walkthrough.v1";
constexpr const char* SUMMARY_SCHEMA = "wsk.summary.v1";

/// Pretty-printed JSON; invalid UTF-8 from captured output becomes U+FFFD
std::string dump_json(const nlohmann::json& j);

nlohmann::json outcome_to_json(const ExecutionOutcome& outcome, bool include_output = true);

nlohmann::json summary_to_json(const RunSummary& summary, bool include_output = true);

nlohmann::json plan_to_json(const ExecutionPlan& plan);
std::string plan_to_markdown(const ExecutionPlan& plan);

// summary may be null when only planning; otherwise observed results are included
nlohmann::json walkthrough_to_json(const ExecutionPlan& plan, const RunSummary* summary);
std::string walkthrough_to_markdown(const ExecutionPlan& plan, const RunSummary* summary);

/// Shell lines that recreate the plan's environment changes
std::vector<std::string> environment_exports(const ExecutionPlan& plan);

/**
 * @brief Write every document into dir (created if needed)
 *
 * Files: plan.json, plan.md, walkthrough.json, walkthrough.md and, when a
 * summary is given, summary.json. Each file is written atomically.
 *
 * @return Paths written, or IO_ERROR
 */
Result<std::vector<std::string>> write_artifacts(const std::string& dir,
                                                 const ExecutionPlan& plan,
                                                 const RunSummary* summary);

} // namespace wsk

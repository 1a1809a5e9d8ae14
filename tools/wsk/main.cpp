/**
 * wsk CLI - Entry Point
 *
 * Workspace skill orchestrator command-line interface.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace wsk::cli::commands {
    void setup_run(CLI::App* app, GlobalOptions& opts);
    void setup_plan(CLI::App* app, GlobalOptions& opts);
    void setup_graph(CLI::App* app, GlobalOptions& opts);
    void setup_affected(CLI::App* app, GlobalOptions& opts);
    void setup_skills(CLI::App* app, GlobalOptions& opts);
    void setup_env(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace wsk::cli;

    CLI::App app{"wsk - workspace skill orchestrator"};
    app.set_version_flag("-V,--version", WSK_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("-c,--config", opts.config, "Workspace file (default: $WSK_CONFIG or ./wsk.json)");
    app.add_option("--log-level", opts.log_level, "trace, debug, info, warn, error or off");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* run_cmd = app.add_subcommand("run", "Run a skill against packages");
    commands::setup_run(run_cmd, opts);

    auto* plan_cmd = app.add_subcommand("plan", "Show what a run would do");
    commands::setup_plan(plan_cmd, opts);

    auto* graph_cmd = app.add_subcommand("graph", "Show the package graph");
    commands::setup_graph(graph_cmd, opts);

    auto* affected_cmd = app.add_subcommand("affected", "List packages affected by a change");
    commands::setup_affected(affected_cmd, opts);

    auto* skills_cmd = app.add_subcommand("skills", "List registered skills");
    commands::setup_skills(skills_cmd, opts);

    auto* env_cmd = app.add_subcommand("env", "Show the execution environment");
    commands::setup_env(env_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}

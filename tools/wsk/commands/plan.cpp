/**
 * wsk CLI - plan command
 *
 * Print the implementation plan (or verification walkthrough) for a skill
 * without running anything.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace wsk::cli::commands {

namespace {

struct PlanOptions {
    std::string skill;
    std::vector<std::string> targets;
    bool only_affected = false;
    bool walkthrough = false;
    std::string write_dir;
};

int cmd_plan(const GlobalOptions& opts, const PlanOptions& plan_opts) {
    init_cli_logging(opts);

    auto opened = open_workspace(opts);
    if (opened.isErr()) {
        return report_error(opened.error(), opts);
    }
    auto& ws = opened.value();

    RunOptions options = ws->default_run_options();
    options.only_affected = plan_opts.only_affected;

    auto planned = ws->plan(plan_opts.skill, to_target_set(plan_opts.targets), options);
    if (planned.isErr()) {
        return report_error(planned.error(), opts);
    }
    const ExecutionPlan& plan = planned.value();

    if (!plan_opts.write_dir.empty()) {
        auto written = write_artifacts(plan_opts.write_dir, plan, nullptr);
        if (written.isErr()) {
            return report_error(written.error(), opts);
        }
        if (!opts.json && !opts.quiet) {
            for (const auto& path : written.value()) {
                std::cout << "wrote " << path << std::endl;
            }
        }
    }

    if (opts.json) {
        output_json(plan_opts.walkthrough ? walkthrough_to_json(plan, nullptr) : plan_to_json(plan));
    } else if (!opts.quiet) {
        std::cout << (plan_opts.walkthrough ? walkthrough_to_markdown(plan, nullptr)
                                            : plan_to_markdown(plan));
    }
    return EXIT_OK;
}

} // anonymous namespace

void setup_plan(CLI::App* app, GlobalOptions& opts) {
    static PlanOptions plan_opts;

    app->add_option("skill", plan_opts.skill, "Skill to plan")->required();
    app->add_option("targets", plan_opts.targets, "Target packages (default: all)");
    app->add_flag("--only-affected", plan_opts.only_affected, "Treat targets as changed; plan what they affect");
    app->add_flag("--walkthrough", plan_opts.walkthrough, "Show the commands instead of the plan");
    app->add_option("--write", plan_opts.write_dir, "Also write plan and walkthrough files here");

    app->callback([&opts]() {
        std::exit(cmd_plan(opts, plan_opts));
    });
}

} // namespace wsk::cli::commands

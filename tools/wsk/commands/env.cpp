/**
 * wsk CLI - env command
 *
 * Validate the environment roots and print the resulting context.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace wsk::cli::commands {

namespace {

struct EnvOptions {
    bool all = false;
    std::string skill;
};

int cmd_env(const GlobalOptions& opts, const EnvOptions& env_opts) {
    init_cli_logging(opts);

    auto opened = open_workspace(opts);
    if (opened.isErr()) {
        return report_error(opened.error(), opts);
    }
    auto& ws = opened.value();

    auto built = ws->load_environment();
    if (built.isErr()) {
        return report_error(built.error(), opts);
    }
    EnvironmentContext env = built.value();

    if (!env_opts.skill.empty()) {
        auto registry = ws->load_skills();
        if (registry.isErr()) {
            return report_error(registry.error(), opts);
        }
        auto skill = registry.value().resolve(env_opts.skill);
        if (skill.isErr()) {
            return report_error(skill.error(), opts);
        }
        env = env.with(skill.value()->environment);
    }

    const EnvTable& shown = env_opts.all ? env.table() : env.assignments();

    if (opts.json) {
        nlohmann::json j;
        j["base_root"] = env.base_root();
        j["overlays"] = env.overlays();
        j["environment"] = shown;
        j["unset"] = env.removed();
        output_json(j);
        return EXIT_OK;
    }

    if (!opts.quiet) {
        std::cout << "# base root: " << env.base_root() << std::endl;
        for (const auto& overlay : env.overlays()) {
            std::cout << "# overlay:   " << overlay << std::endl;
        }
    }
    for (const auto& [key, value] : shown) {
        std::cout << "export " << key << "=" << shell_join({value}) << std::endl;
    }
    for (const auto& key : env.removed()) {
        std::cout << "unset " << key << std::endl;
    }
    return EXIT_OK;
}

} // anonymous namespace

void setup_env(CLI::App* app, GlobalOptions& opts) {
    static EnvOptions env_opts;

    app->add_flag("--all", env_opts.all, "Include inherited variables");
    app->add_option("--skill", env_opts.skill, "Apply a skill's environment additions");

    app->callback([&opts]() {
        std::exit(cmd_env(opts, env_opts));
    });
}

} // namespace wsk::cli::commands

/**
 * wsk CLI - skills command
 *
 * List the skill catalog, or show one skill in detail.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace wsk::cli::commands {

namespace {

struct SkillsOptions {
    std::string name;
};

nlohmann::json skill_to_json(const Skill& skill) {
    nlohmann::json j;
    j["name"] = skill.name;
    j["description"] = skill.description;
    j["command"] = skill.command;
    j["requires"] = skill.required_capabilities();
    j["success_exit_codes"] = skill.success_exit_codes;
    j["timeout_ms"] = skill.timeout ? nlohmann::json(skill.timeout->count()) : nlohmann::json(nullptr);
    j["working_directory"] = skill.working_directory;

    nlohmann::json env = nlohmann::json::object();
    for (const auto& [key, val] : skill.environment) {
        env[key] = {{"op", env_op_to_string(val.op)}, {"value", val.value}};
    }
    j["environment"] = env;

    nlohmann::json classifiers = nlohmann::json::array();
    for (const auto& rule : skill.classifiers) {
        classifiers.push_back({{"pattern", rule.pattern},
                               {"category", rule.category},
                               {"force_failure", rule.force_failure}});
    }
    j["classifiers"] = classifiers;
    return j;
}

int cmd_skills(const GlobalOptions& opts, const SkillsOptions& skills_opts) {
    init_cli_logging(opts);

    auto opened = open_workspace(opts);
    if (opened.isErr()) {
        return report_error(opened.error(), opts);
    }
    auto registry = opened.value()->load_skills();
    if (registry.isErr()) {
        return report_error(registry.error(), opts);
    }
    const SkillRegistry& reg = registry.value();

    if (!skills_opts.name.empty()) {
        auto skill = reg.resolve(skills_opts.name);
        if (skill.isErr()) {
            return report_error(skill.error(), opts);
        }
        const Skill& s = *skill.value();
        if (opts.json) {
            output_json(skill_to_json(s));
            return EXIT_OK;
        }
        std::cout << s.name << std::endl;
        if (!s.description.empty()) std::cout << "  " << s.description << std::endl;
        std::cout << "  command:  " << shell_join(s.command) << std::endl;
        std::cout << "  requires: ";
        auto caps = s.required_capabilities();
        for (size_t i = 0; i < caps.size(); ++i) {
            std::cout << (i > 0 ? ", " : "") << caps[i];
        }
        std::cout << std::endl;
        if (s.timeout) std::cout << "  timeout:  " << format_duration(*s.timeout) << std::endl;
        for (const auto& rule : s.classifiers) {
            std::cout << "  classify: /" << rule.pattern << "/ -> " << rule.category
                      << (rule.force_failure ? " (fails run)" : "") << std::endl;
        }
        return EXIT_OK;
    }

    if (opts.json) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& name : reg.names()) {
            j.push_back(skill_to_json(*reg.resolve(name).value()));
        }
        output_json(j);
        return EXIT_OK;
    }

    if (reg.size() == 0) {
        std::cout << "No skills registered." << std::endl;
        return EXIT_OK;
    }
    for (const auto& name : reg.names()) {
        const Skill& s = *reg.resolve(name).value();
        std::cout << "  " << s.name;
        if (!s.description.empty()) std::cout << " - " << s.description;
        std::cout << std::endl;
    }
    return EXIT_OK;
}

} // anonymous namespace

void setup_skills(CLI::App* app, GlobalOptions& opts) {
    static SkillsOptions skills_opts;

    app->add_option("name", skills_opts.name, "Show one skill");

    app->callback([&opts]() {
        std::exit(cmd_skills(opts, skills_opts));
    });
}

} // namespace wsk::cli::commands

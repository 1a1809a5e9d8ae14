/**
 * wsk CLI - graph and affected commands
 *
 * Inspect the package graph built from the workspace manifests.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace wsk::cli::commands {

namespace {

struct GraphOptions {
    std::vector<std::string> targets;
    bool dot = false;
};

struct AffectedOptions {
    std::vector<std::string> changed;
};

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

int cmd_graph(const GlobalOptions& opts, const GraphOptions& graph_opts) {
    init_cli_logging(opts);

    auto opened = open_workspace(opts);
    if (opened.isErr()) {
        return report_error(opened.error(), opts);
    }
    auto graph = opened.value()->load_graph();
    if (graph.isErr()) {
        return report_error(graph.error(), opts);
    }
    const PackageGraph& g = graph.value();

    std::vector<std::string> order;
    if (graph_opts.targets.empty()) {
        order = g.full_order();
    } else {
        auto ordered = g.topological_order(to_target_set(graph_opts.targets));
        if (ordered.isErr()) {
            return report_error(ordered.error(), opts);
        }
        order = ordered.value();
    }

    if (opts.json) {
        nlohmann::json j;
        j["order"] = order;
        nlohmann::json packages = nlohmann::json::array();
        for (const auto& name : order) {
            const Package* pkg = g.find(name);
            packages.push_back({{"name", name},
                                {"path", pkg->path},
                                {"dependencies", pkg->dependencies},
                                {"dependents", g.dependents_of(name)},
                                {"capabilities", pkg->capabilities}});
        }
        j["packages"] = packages;
        output_json(j);
    } else if (graph_opts.dot) {
        std::cout << "digraph packages {" << std::endl;
        for (const auto& name : order) {
            std::cout << "  \"" << name << "\";" << std::endl;
            for (const auto& dep : g.dependencies_of(name)) {
                std::cout << "  \"" << name << "\" -> \"" << dep << "\";" << std::endl;
            }
        }
        std::cout << "}" << std::endl;
    } else {
        for (const auto& name : order) {
            const auto& deps = g.dependencies_of(name);
            std::cout << name;
            if (!deps.empty()) std::cout << " <- " << join_names(deps);
            std::cout << std::endl;
        }
    }
    return EXIT_OK;
}

int cmd_affected(const GlobalOptions& opts, const AffectedOptions& affected_opts) {
    init_cli_logging(opts);

    auto opened = open_workspace(opts);
    if (opened.isErr()) {
        return report_error(opened.error(), opts);
    }
    auto graph = opened.value()->load_graph();
    if (graph.isErr()) {
        return report_error(graph.error(), opts);
    }
    const PackageGraph& g = graph.value();

    auto affected = g.affected_by(to_target_set(affected_opts.changed));
    if (affected.isErr()) {
        return report_error(affected.error(), opts);
    }
    auto ordered = g.order_subset(affected.value());
    if (ordered.isErr()) {
        return report_error(ordered.error(), opts);
    }

    if (opts.json) {
        nlohmann::json j;
        j["changed"] = affected_opts.changed;
        j["affected"] = ordered.value();
        output_json(j);
    } else {
        for (const auto& name : ordered.value()) {
            std::cout << name << std::endl;
        }
    }
    return EXIT_OK;
}

} // anonymous namespace

void setup_graph(CLI::App* app, GlobalOptions& opts) {
    static GraphOptions graph_opts;

    app->add_option("targets", graph_opts.targets, "Restrict to targets and their dependencies");
    app->add_flag("--dot", graph_opts.dot, "Graphviz output");

    app->callback([&opts]() {
        std::exit(cmd_graph(opts, graph_opts));
    });
}

void setup_affected(CLI::App* app, GlobalOptions& opts) {
    static AffectedOptions affected_opts;

    app->add_option("changed", affected_opts.changed, "Changed packages")->required();

    app->callback([&opts]() {
        std::exit(cmd_affected(opts, affected_opts));
    });
}

} // namespace wsk::cli::commands

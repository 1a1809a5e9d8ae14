#include "wsk/package_graph.hpp"

#include <algorithm>
#include <deque>
#include <functional>

#include <spdlog/spdlog.h>

namespace wsk {

namespace {

const std::vector<std::string> kNoNames;

enum class Mark { Unvisited, InProgress, Done };

// Depth-first search that returns the first cycle found as "a -> b -> a"
std::string find_cycle(const std::map<std::string, Package>& packages) {
    std::map<std::string, Mark> marks;
    std::vector<std::string> stack;
    std::string cycle;

    std::function<bool(const std::string&)> visit = [&](const std::string& name) -> bool {
        marks[name] = Mark::InProgress;
        stack.push_back(name);

        for (const auto& dep : packages.at(name).dependencies) {
            Mark m = marks[dep];
            if (m == Mark::InProgress) {
                auto start = std::find(stack.begin(), stack.end(), dep);
                for (auto it = start; it != stack.end(); ++it) {
                    cycle += *it + " -> ";
                }
                cycle += dep;
                return true;
            }
            if (m == Mark::Unvisited && visit(dep)) {
                return true;
            }
        }

        stack.pop_back();
        marks[name] = Mark::Done;
        return false;
    };

    for (const auto& [name, pkg] : packages) {
        if (marks[name] == Mark::Unvisited && visit(name)) {
            return cycle;
        }
    }
    return "";
}

} // namespace

Result<PackageGraph> PackageGraph::load(std::vector<Package> manifests) {
    PackageGraph graph;

    for (auto& pkg : manifests) {
        if (pkg.name.empty()) {
            return Result<PackageGraph>::err(Error(ErrorCode::INVALID_MANIFEST,
                "package without a name" +
                (pkg.source_path.empty() ? std::string() : " in " + pkg.source_path)));
        }
        if (graph.packages_.count(pkg.name)) {
            return Result<PackageGraph>::err(Error(ErrorCode::DUPLICATE_PACKAGE,
                "package declared twice: " + pkg.name));
        }

        std::sort(pkg.dependencies.begin(), pkg.dependencies.end());
        pkg.dependencies.erase(std::unique(pkg.dependencies.begin(), pkg.dependencies.end()),
                               pkg.dependencies.end());
        if (pkg.path.empty()) {
            pkg.path = pkg.name;
        }

        std::string name = pkg.name;
        graph.packages_.emplace(name, std::move(pkg));
    }

    for (const auto& [name, pkg] : graph.packages_) {
        for (const auto& dep : pkg.dependencies) {
            if (dep == name) {
                return Result<PackageGraph>::err(Error(ErrorCode::CYCLE_DETECTED,
                    "package depends on itself: " + name));
            }
            if (!graph.packages_.count(dep)) {
                return Result<PackageGraph>::err(Error(ErrorCode::UNKNOWN_PACKAGE,
                    "package " + name + " depends on unknown package " + dep));
            }
            graph.dependents_[dep].push_back(name);
        }
    }

    std::string cycle = find_cycle(graph.packages_);
    if (!cycle.empty()) {
        return Result<PackageGraph>::err(Error(ErrorCode::CYCLE_DETECTED,
            "dependency cycle: " + cycle));
    }

    spdlog::debug("package graph loaded: {} packages", graph.packages_.size());
    return Result<PackageGraph>::ok(std::move(graph));
}

Result<void> PackageGraph::check_known(const std::set<std::string>& names) const {
    for (const auto& name : names) {
        if (!packages_.count(name)) {
            return Result<void>::err(Error(ErrorCode::UNKNOWN_PACKAGE,
                                           "unknown package: " + name));
        }
    }
    return Result<void>::ok();
}

std::vector<std::string> PackageGraph::kahn_order(const std::set<std::string>& members) const {
    std::map<std::string, size_t> pending;
    std::set<std::string> ready;

    for (const auto& name : members) {
        size_t count = 0;
        for (const auto& dep : packages_.at(name).dependencies) {
            if (members.count(dep)) ++count;
        }
        pending[name] = count;
        if (count == 0) ready.insert(name);
    }

    std::vector<std::string> order;
    order.reserve(members.size());

    while (!ready.empty()) {
        std::string next = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(next);

        for (const auto& dependent : dependents_of(next)) {
            auto it = pending.find(dependent);
            if (it == pending.end()) continue;
            if (--it->second == 0) {
                ready.insert(dependent);
            }
        }
    }

    return order;
}

Result<std::vector<std::string>> PackageGraph::topological_order(
    const std::set<std::string>& targets) const {
    auto known = check_known(targets);
    if (known.isErr()) {
        return Result<std::vector<std::string>>::err(known.error());
    }

    std::set<std::string> closure;
    std::deque<std::string> queue(targets.begin(), targets.end());
    while (!queue.empty()) {
        std::string name = queue.front();
        queue.pop_front();
        if (!closure.insert(name).second) continue;
        for (const auto& dep : packages_.at(name).dependencies) {
            if (!closure.count(dep)) queue.push_back(dep);
        }
    }

    return Result<std::vector<std::string>>::ok(kahn_order(closure));
}

Result<std::vector<std::string>> PackageGraph::order_subset(
    const std::set<std::string>& members) const {
    auto known = check_known(members);
    if (known.isErr()) {
        return Result<std::vector<std::string>>::err(known.error());
    }
    return Result<std::vector<std::string>>::ok(kahn_order(members));
}

Result<std::set<std::string>> PackageGraph::affected_by(
    const std::set<std::string>& changed) const {
    auto known = check_known(changed);
    if (known.isErr()) {
        return Result<std::set<std::string>>::err(known.error());
    }

    std::set<std::string> affected;
    std::deque<std::string> queue(changed.begin(), changed.end());
    while (!queue.empty()) {
        std::string name = queue.front();
        queue.pop_front();
        if (!affected.insert(name).second) continue;
        for (const auto& dependent : dependents_of(name)) {
            if (!affected.count(dependent)) queue.push_back(dependent);
        }
    }

    return Result<std::set<std::string>>::ok(std::move(affected));
}

std::vector<std::string> PackageGraph::full_order() const {
    std::set<std::string> all;
    for (const auto& [name, pkg] : packages_) {
        all.insert(name);
    }
    return kahn_order(all);
}

const Package* PackageGraph::find(const std::string& name) const {
    auto it = packages_.find(name);
    return it == packages_.end() ? nullptr : &it->second;
}

bool PackageGraph::contains(const std::string& name) const {
    return packages_.count(name) > 0;
}

const std::vector<std::string>& PackageGraph::dependencies_of(const std::string& name) const {
    auto it = packages_.find(name);
    return it == packages_.end() ? kNoNames : it->second.dependencies;
}

const std::vector<std::string>& PackageGraph::dependents_of(const std::string& name) const {
    auto it = dependents_.find(name);
    return it == dependents_.end() ? kNoNames : it->second;
}

std::vector<std::string> PackageGraph::names() const {
    std::vector<std::string> result;
    result.reserve(packages_.size());
    for (const auto& [name, pkg] : packages_) {
        result.push_back(name);
    }
    return result;
}

} // namespace wsk

#pragma once

/**
 * @file package_graph.hpp
 * @brief Dependency graph over workspace packages
 *
 * Built once from manifest records and read-only afterwards, so concurrent
 * readers need no locking. Loading rejects unknown dependency names,
 * duplicate package names and cycles.
 */

#include "wsk/result.hpp"
#include "wsk/types.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace wsk {

class PackageGraph {
public:
    PackageGraph() = default;

    /**
     * @brief Build a graph from manifest records
     * @return The graph, or CYCLE_DETECTED / UNKNOWN_PACKAGE / DUPLICATE_PACKAGE
     */
    static Result<PackageGraph> load(std::vector<Package> manifests);

    /**
     * @brief Targets plus their transitive dependencies, dependencies first
     *
     * Packages whose dependencies are all placed are emitted in lexicographic
     * name order, so the result is fully deterministic.
     */
    Result<std::vector<std::string>> topological_order(const std::set<std::string>& targets) const;

    /// Order restricted to exactly `members`; dependencies outside are ignored
    Result<std::vector<std::string>> order_subset(const std::set<std::string>& members) const;

    /// Changed packages plus everything that transitively depends on them
    Result<std::set<std::string>> affected_by(const std::set<std::string>& changed) const;

    /// Every package, dependency-first
    std::vector<std::string> full_order() const;

    const Package* find(const std::string& name) const;
    bool contains(const std::string& name) const;

    const std::vector<std::string>& dependencies_of(const std::string& name) const;
    const std::vector<std::string>& dependents_of(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const { return packages_.size(); }
    bool empty() const { return packages_.empty(); }

private:
    Result<void> check_known(const std::set<std::string>& names) const;
    std::vector<std::string> kahn_order(const std::set<std::string>& members) const;

    std::map<std::string, Package> packages_;
    std::map<std::string, std::vector<std::string>> dependents_;
};

} // namespace wsk

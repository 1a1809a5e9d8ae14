#include <doctest/doctest.h>
#include <wsk/package_graph.hpp>

#include <algorithm>

using namespace wsk;

namespace {

Package pkg(const std::string& name, std::vector<std::string> deps = {},
            std::vector<std::string> caps = {}) {
    Package p;
    p.name = name;
    p.dependencies = std::move(deps);
    p.capabilities = std::move(caps);
    return p;
}

size_t position(const std::vector<std::string>& order, const std::string& name) {
    return static_cast<size_t>(std::find(order.begin(), order.end(), name) - order.begin());
}

PackageGraph load_ok(std::vector<Package> packages) {
    auto graph = PackageGraph::load(std::move(packages));
    REQUIRE(graph.isOk());
    return graph.value();
}

} // namespace

TEST_CASE("load: builds graph and reverse edges") {
    auto g = load_ok({pkg("core"), pkg("tool", {"core"}), pkg("app", {"tool", "core"})});

    CHECK(g.size() == 3);
    CHECK(g.contains("core"));
    CHECK_FALSE(g.contains("missing"));
    CHECK(g.dependencies_of("app") == std::vector<std::string>{"core", "tool"});

    auto dependents = g.dependents_of("core");
    std::sort(dependents.begin(), dependents.end());
    CHECK(dependents == std::vector<std::string>{"app", "tool"});
    CHECK(g.dependents_of("app").empty());
}

TEST_CASE("load: package path defaults to its name") {
    auto g = load_ok({pkg("core")});
    REQUIRE(g.find("core") != nullptr);
    CHECK(g.find("core")->path == "core");
    CHECK(g.find("nope") == nullptr);
}

TEST_CASE("load: duplicate dependencies are collapsed") {
    auto g = load_ok({pkg("core"), pkg("tool", {"core", "core"})});
    CHECK(g.dependencies_of("tool").size() == 1);
}

TEST_CASE("load: rejects bad manifests") {
    SUBCASE("unknown dependency") {
        auto g = PackageGraph::load({pkg("tool", {"core"})});
        REQUIRE(g.isErr());
        CHECK(g.error().code() == ErrorCode::UNKNOWN_PACKAGE);
        CHECK(g.error().message().find("core") != std::string::npos);
    }

    SUBCASE("duplicate name") {
        auto g = PackageGraph::load({pkg("core"), pkg("core")});
        REQUIRE(g.isErr());
        CHECK(g.error().code() == ErrorCode::DUPLICATE_PACKAGE);
    }

    SUBCASE("self dependency") {
        auto g = PackageGraph::load({pkg("core", {"core"})});
        REQUIRE(g.isErr());
        CHECK(g.error().code() == ErrorCode::CYCLE_DETECTED);
    }

    SUBCASE("empty name") {
        auto g = PackageGraph::load({pkg("")});
        REQUIRE(g.isErr());
        CHECK(g.error().code() == ErrorCode::INVALID_MANIFEST);
    }
}

TEST_CASE("load: cycle error names the cycle path") {
    auto g = PackageGraph::load({pkg("a", {"b"}), pkg("b", {"c"}), pkg("c", {"a"}), pkg("d")});
    REQUIRE(g.isErr());
    CHECK(g.error().code() == ErrorCode::CYCLE_DETECTED);
    CHECK(g.error().isConfigError());
    CHECK(g.error().message() == "dependency cycle: a -> b -> c -> a");
}

TEST_CASE("topological_order: dependencies come first") {
    auto g = load_ok({pkg("base"), pkg("core", {"base"}), pkg("net", {"base"}),
                      pkg("app", {"core", "net"}), pkg("docs")});

    auto order = g.topological_order({"app"});
    REQUIRE(order.isOk());
    const auto& o = order.value();

    CHECK(o.size() == 4);
    CHECK(std::find(o.begin(), o.end(), "docs") == o.end());
    for (const auto& name : o) {
        for (const auto& dep : g.dependencies_of(name)) {
            CHECK(position(o, dep) < position(o, name));
        }
    }
}

TEST_CASE("topological_order: independent packages tie-break by name") {
    auto g = load_ok({pkg("zeta"), pkg("alpha"), pkg("mid", {"zeta"}), pkg("beta")});

    auto order = g.topological_order({"zeta", "alpha", "mid", "beta"});
    REQUIRE(order.isOk());
    CHECK(order.value() == std::vector<std::string>{"alpha", "beta", "zeta", "mid"});
}

TEST_CASE("topological_order: repeated calls give the same order") {
    auto g = load_ok({pkg("c"), pkg("b", {"c"}), pkg("a", {"c"}), pkg("d", {"a", "b"})});
    auto first = g.topological_order({"d"});
    auto second = g.topological_order({"d"});
    REQUIRE(first.isOk());
    REQUIRE(second.isOk());
    CHECK(first.value() == second.value());
    CHECK(first.value() == std::vector<std::string>{"c", "a", "b", "d"});
}

TEST_CASE("topological_order: unknown target is a configuration error") {
    auto g = load_ok({pkg("core")});
    auto order = g.topological_order({"core", "ghost"});
    REQUIRE(order.isErr());
    CHECK(order.error().code() == ErrorCode::UNKNOWN_PACKAGE);
}

TEST_CASE("affected_by: changed packages plus transitive dependents") {
    auto g = load_ok({pkg("base"), pkg("core", {"base"}), pkg("tool", {"core"}),
                      pkg("app", {"tool"}), pkg("other")});

    auto affected = g.affected_by({"core"});
    REQUIRE(affected.isOk());
    CHECK(affected.value() == std::set<std::string>{"app", "core", "tool"});

    auto leaf = g.affected_by({"app"});
    REQUIRE(leaf.isOk());
    CHECK(leaf.value() == std::set<std::string>{"app"});

    auto none = g.affected_by({});
    REQUIRE(none.isOk());
    CHECK(none.value().empty());
}

TEST_CASE("order_subset: ignores dependencies outside the subset") {
    auto g = load_ok({pkg("base"), pkg("core", {"base"}), pkg("tool", {"core"})});
    auto order = g.order_subset({"tool", "core"});
    REQUIRE(order.isOk());
    CHECK(order.value() == std::vector<std::string>{"core", "tool"});
}

TEST_CASE("full_order: covers every package") {
    auto g = load_ok({pkg("b", {"a"}), pkg("a"), pkg("c")});
    CHECK(g.full_order() == std::vector<std::string>{"a", "b", "c"});
    CHECK(g.names() == std::vector<std::string>{"a", "b", "c"});
}

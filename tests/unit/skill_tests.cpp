#include <doctest/doctest.h>
#include <wsk/skill.hpp>
#include <wsk/skill_registry.hpp>

using namespace wsk;

namespace {

Skill make_skill(const std::string& name, std::vector<std::string> command = {"true"}) {
    Skill s;
    s.name = name;
    s.command = std::move(command);
    return s;
}

Package make_package(const std::string& name, std::vector<std::string> caps) {
    Package p;
    p.name = name;
    p.capabilities = std::move(caps);
    return p;
}

} // namespace

// ============================================================================
// Applicability
// ============================================================================

TEST_CASE("applies_to: defaults to a capability named after the skill") {
    Skill lint = make_skill("lint");
    CHECK(lint.required_capabilities() == std::vector<std::string>{"lint"});
    CHECK(lint.applies_to(make_package("core", {"build", "lint"})));
    CHECK_FALSE(lint.applies_to(make_package("tool", {"build", "test"})));
}

TEST_CASE("applies_to: every required capability must be declared") {
    Skill s = make_skill("integration");
    s.requires_capabilities = {"test", "network"};
    CHECK(s.applies_to(make_package("svc", {"network", "test"})));
    CHECK_FALSE(s.applies_to(make_package("lib", {"test"})));
}

// ============================================================================
// Classification
// ============================================================================

TEST_CASE("classify: success codes") {
    Skill s = make_skill("test");
    s.success_exit_codes = {0, 5};
    CHECK(s.classify(0, "", "").success);
    CHECK(s.classify(5, "", "").success);

    auto failed = s.classify(1, "", "");
    CHECK_FALSE(failed.success);
    CHECK_FALSE(failed.forced);
    CHECK(failed.category.empty());
}

TEST_CASE("classify: first matching rule names the failure") {
    Skill s = make_skill("build");
    s.classifiers.push_back({"error: .*undefined", "compiler error", ClassifierStream::Stderr, false});
    s.classifiers.push_back({"warning:", "lint violations found", ClassifierStream::Any, false});

    auto compiler = s.classify(2, "", "main.c:3: error: x undefined\nwarning: unused");
    CHECK_FALSE(compiler.success);
    CHECK(compiler.category == "compiler error");

    auto lint = s.classify(1, "warning: long line", "");
    CHECK(lint.category == "lint violations found");

    SUBCASE("stream restriction is honoured") {
        auto wrong_stream = s.classify(2, "error: x undefined", "");
        CHECK(wrong_stream.category.empty());
    }
}

TEST_CASE("classify: a failure rule overrides a success exit code") {
    Skill s = make_skill("test");
    s.classifiers.push_back({"0 tests ran", "no tests executed", ClassifierStream::Stdout, true});
    s.classifiers.push_back({"warning", "ignored on success", ClassifierStream::Any, false});

    auto ok = s.classify(0, "12 tests ran\nwarning: slow", "");
    CHECK(ok.success);
    CHECK(ok.category.empty());

    auto forced = s.classify(0, "0 tests ran", "");
    CHECK_FALSE(forced.success);
    CHECK(forced.forced);
    CHECK(forced.category == "no tests executed");
}

TEST_CASE("classify: large output is matched per line without exhausting the stack") {
    Skill s = make_skill("build");
    s.classifiers.push_back({"warning: .*", "lint violations found", ClassifierStream::Any, false});
    s.classifiers.push_back({"^fatal:", "compiler error", ClassifierStream::Stderr, false});

    auto single_line = s.classify(1, "warning: " + std::string(200 * 1024, 'x'), "");
    CHECK_FALSE(single_line.success);

    std::string huge = std::string(200 * 1024, 'x') + "\nwarning: " + std::string(16 * 1024, 'x');
    auto lint = s.classify(1, huge, "");
    CHECK(lint.category == "lint violations found");

    // Line anchors apply per line; early output beyond the scanned tail is ignored
    std::string noisy = "fatal: early\n" + std::string(128 * 1024, 'y') + "\nfatal: late\n";
    CHECK(s.classify(1, "", noisy).category == "compiler error");
    CHECK(s.classify(1, "", "fatal: early\n" + std::string(128 * 1024, 'y')).category.empty());
}

// ============================================================================
// Template Expansion
// ============================================================================

TEST_CASE("expand_template: substitutes known placeholders") {
    auto env = EnvironmentContext::from_table({{"TOOLCHAIN", "/opt/tc"}});
    TemplateVars vars{"core", "/ws/libs/core", "/ws", "build"};

    CHECK(expand_template("{package}", vars, env) == "core");
    CHECK(expand_template("--dir={package_path}", vars, env) == "--dir=/ws/libs/core");
    CHECK(expand_template("{workspace}/out/{skill}", vars, env) == "/ws/out/build");
    CHECK(expand_template("{env:TOOLCHAIN}/bin/cc", vars, env) == "/opt/tc/bin/cc");
    CHECK(expand_template("[{env:UNSET_VAR}]", vars, env) == "[]");
}

TEST_CASE("expand_template: unknown placeholders and stray braces stay verbatim") {
    auto env = EnvironmentContext::from_table({});
    TemplateVars vars{"core", "/ws/core", "/ws", "lint"};

    CHECK(expand_template("{unknown}-{package}", vars, env) == "{unknown}-core");
    CHECK(expand_template("for f in *; do { echo $f; }; done", vars, env) ==
          "for f in *; do { echo $f; }; done");
    CHECK(expand_template("open {brace", vars, env) == "open {brace");
}

TEST_CASE("expand_command: expands each argument separately") {
    Skill s = make_skill("lint", {"lint-tool", "--root", "{workspace}", "{package_path}/src"});
    auto env = EnvironmentContext::from_table({});
    TemplateVars vars{"core", "/ws/core dir", "/ws", "lint"};

    auto argv = expand_command(s, vars, env);
    CHECK(argv == std::vector<std::string>{"lint-tool", "--root", "/ws", "/ws/core dir/src"});
}

TEST_CASE("shell_join: quotes only what needs quoting") {
    CHECK(shell_join({"make", "-C", "/ws/core"}) == "make -C /ws/core");
    CHECK(shell_join({"echo", "hello world"}) == "echo 'hello world'");
    CHECK(shell_join({"echo", "it's"}) == "echo 'it'\\''s'");
    CHECK(shell_join({"printf", ""}) == "printf ''");
}

// ============================================================================
// Registry
// ============================================================================

TEST_CASE("SkillRegistry: register and resolve") {
    SkillRegistry registry;
    REQUIRE(registry.register_skill(make_skill("build")).isOk());
    REQUIRE(registry.register_skill(make_skill("test")).isOk());

    CHECK(registry.size() == 2);
    CHECK(registry.contains("build"));
    CHECK(registry.names() == std::vector<std::string>{"build", "test"});

    auto resolved = registry.resolve("test");
    REQUIRE(resolved.isOk());
    CHECK(resolved.value()->name == "test");
}

TEST_CASE("SkillRegistry: unknown skill") {
    SkillRegistry registry;
    auto resolved = registry.resolve("deploy");
    REQUIRE(resolved.isErr());
    CHECK(resolved.error().code() == ErrorCode::UNKNOWN_SKILL);
}

TEST_CASE("SkillRegistry: duplicate skill is rejected") {
    SkillRegistry registry;
    REQUIRE(registry.register_skill(make_skill("build", {"make"})).isOk());
    auto again = registry.register_skill(make_skill("build", {"ninja"}));
    REQUIRE(again.isErr());
    CHECK(again.error().code() == ErrorCode::DUPLICATE_SKILL);
    CHECK(registry.resolve("build").value()->command.front() == "make");
}

TEST_CASE("SkillRegistry: invalid skills are rejected at registration") {
    SkillRegistry registry;

    SUBCASE("empty name") {
        auto r = registry.register_skill(make_skill(""));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::INVALID_SKILL);
    }

    SUBCASE("empty command") {
        auto r = registry.register_skill(make_skill("build", {}));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::INVALID_SKILL);
    }

    SUBCASE("bad classifier pattern") {
        Skill s = make_skill("lint");
        s.classifiers.push_back({"([unclosed", "broken", ClassifierStream::Any, false});
        auto r = registry.register_skill(s);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::INVALID_SKILL);
    }

    CHECK(registry.size() == 0);
}

TEST_CASE("SkillRegistry: empty success codes default to zero") {
    SkillRegistry registry;
    Skill s = make_skill("build");
    s.success_exit_codes.clear();
    REQUIRE(registry.register_skill(s).isOk());
    CHECK(registry.resolve("build").value()->success_exit_codes == std::vector<int>{0});
}

TEST_CASE("SkillRegistry: from_skills stops at the first duplicate") {
    auto registry = SkillRegistry::from_skills({make_skill("a"), make_skill("b"), make_skill("a")});
    REQUIRE(registry.isErr());
    CHECK(registry.error().code() == ErrorCode::DUPLICATE_SKILL);
}

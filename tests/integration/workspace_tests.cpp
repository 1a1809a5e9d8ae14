#include <doctest/doctest.h>
#include <wsk/wsk.hpp>

#include <filesystem>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;

using namespace wsk;

// ============================================================================
// Test Helper: a complete workspace on disk
// ============================================================================

class TestWorkspace {
public:
    TestWorkspace() {
        root_ = fs::temp_directory_path() / ("wsk_workspace_test_" + generate_uuid());
        fs::create_directories(root_);

        write("wsk.json", R"({
            "$schema": "wsk.workspace.v1",
            "manifests": ["packages"],
            "skills": "skills.json",
            "environment": {"base_root": "env/base", "overlays": ["env/ci"]},
            "defaults": {"concurrency": 2, "timeout_ms": 20000, "grace_period_ms": 200},
            "artifacts_dir": "out"
        })");

        write("env/base/wsk_env.json", R"({"environment": {
            "BUILD_MODE": "debug",
            "PATH": {"op": "prepend", "value": "/opt/wsk-test/bin"}
        }})");
        write("env/ci/wsk_env.json", R"({"environment": {"BUILD_MODE": "release"}})");

        write("packages/core/wsk_package.json",
              R"({"name": "core", "capabilities": ["build", "test"]})");
        write("packages/tool/wsk_package.json",
              R"({"name": "tool", "dependencies": ["core"], "capabilities": ["build", "test"]})");
        write("packages/docs/wsk_package.json",
              R"({"name": "docs", "capabilities": ["docs"]})");

        write("skills.json", R"({"skills": [
            {"name": "build",
             "command": "echo \"$BUILD_MODE {package}\" >> {workspace}/build.log; if [ -f FAIL ]; then exit 2; fi"},
            {"name": "test",
             "command": "echo ok",
             "environment": {"TEST_VERBOSE": "1"}}
        ]})");
    }

    ~TestWorkspace() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::string config_path() const { return (root_ / "wsk.json").string(); }
    fs::path path(const std::string& rel) const { return root_ / rel; }

    void write(const std::string& rel, const std::string& content) {
        fs::path p = root_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p) << content;
    }

    std::vector<std::string> build_log() const {
        std::vector<std::string> lines;
        std::ifstream in(root_ / "build.log");
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) lines.push_back(line);
        }
        return lines;
    }

    std::unique_ptr<Workspace> open() const {
        auto ws = Workspace::open(config_path());
        REQUIRE(ws.isOk());
        return std::move(ws.value());
    }

private:
    fs::path root_;
};

// ============================================================================
// Loading
// ============================================================================

TEST_CASE("Workspace: loads graph, skills and layered environment") {
    TestWorkspace tw;
    auto ws = tw.open();

    auto snapshot = ws->load();
    REQUIRE(snapshot.isOk());
    CHECK(snapshot.value().graph.size() == 3);
    CHECK(snapshot.value().registry.contains("build"));
    CHECK(snapshot.value().env.get("BUILD_MODE") == std::optional<std::string>("release"));

    auto path = snapshot.value().env.get("PATH");
    REQUIRE(path.has_value());
    CHECK(path->rfind("/opt/wsk-test/bin", 0) == 0);

    auto options = ws->default_run_options();
    CHECK(options.concurrency == 2);
    CHECK(options.grace_period.count() == 200);
}

TEST_CASE("Workspace: missing environment root is a configuration error") {
    TestWorkspace tw;
    std::error_code ec;
    fs::remove_all(tw.path("env/ci"), ec);
    auto ws = tw.open();

    auto report = ws->run("build", {}, ws->default_run_options());
    REQUIRE(report.isErr());
    CHECK(report.error().code() == ErrorCode::MISSING_ROOT);
    CHECK(report.error().isConfigError());
    CHECK(tw.build_log().empty());
}

TEST_CASE("Workspace: dependency cycle is rejected before execution") {
    TestWorkspace tw;
    tw.write("packages/core/wsk_package.json",
             R"({"name": "core", "dependencies": ["tool"], "capabilities": ["build"]})");
    auto ws = tw.open();

    auto report = ws->run("build", {"tool"}, ws->default_run_options());
    REQUIRE(report.isErr());
    CHECK(report.error().code() == ErrorCode::CYCLE_DETECTED);
    CHECK(tw.build_log().empty());
}

// ============================================================================
// Running
// ============================================================================

TEST_CASE("Workspace: run uses the overlay environment and writes artifacts") {
    TestWorkspace tw;
    auto ws = tw.open();

    auto report = ws->run("build", {"tool"}, ws->default_run_options());
    REQUIRE(report.isOk());
    const RunReport& r = report.value();

    CHECK(r.summary.status == RunStatus::Success);
    CHECK(tw.build_log() == std::vector<std::string>{"release core", "release tool"});
    CHECK(r.plan.steps.size() == 2);
    CHECK(r.artifact_error.empty());
    CHECK(r.artifacts.size() == 5);
    CHECK(fs::exists(tw.path("out/plan.md")));
    CHECK(fs::exists(tw.path("out/summary.json")));

    auto walkthrough = read_file(tw.path("out/walkthrough.md").string());
    REQUIRE(walkthrough.has_value());
    CHECK(walkthrough->find("export BUILD_MODE=release") != std::string::npos);
}

TEST_CASE("Workspace: empty targets select every package") {
    TestWorkspace tw;
    tw.write("packages/core/FAIL", "1");
    auto ws = tw.open();

    auto report = ws->run("build", {}, ws->default_run_options());
    REQUIRE(report.isOk());
    const RunSummary& s = report.value().summary;

    CHECK(s.outcomes.size() == 3);
    CHECK(s.status == RunStatus::Failure);
    CHECK(s.find("core")->exit_code == std::optional<int>(2));
    CHECK(s.find("tool")->kind == OutcomeKind::SkippedUpstreamFailure);
    CHECK(s.find("docs")->kind == OutcomeKind::SkippedUnsupported);
}

TEST_CASE("Workspace: every call sees the files as they are now") {
    TestWorkspace tw;
    auto ws = tw.open();

    auto first = ws->plan("build", {"tool"}, ws->default_run_options());
    REQUIRE(first.isOk());
    CHECK(first.value().steps.size() == 2);

    tw.write("packages/tool/wsk_package.json",
             R"({"name": "tool", "capabilities": ["build"]})");
    auto second = ws->plan("build", {"tool"}, ws->default_run_options());
    REQUIRE(second.isOk());
    CHECK(second.value().steps.size() == 1);
}

TEST_CASE("Workspace: plan includes skill environment") {
    TestWorkspace tw;
    auto ws = tw.open();

    auto plan = ws->plan("test", {"core"}, ws->default_run_options());
    REQUIRE(plan.isOk());
    CHECK(plan.value().environment.at("TEST_VERBOSE") == "1");
    CHECK(plan.value().environment.at("BUILD_MODE") == "release");
    CHECK(plan.value().overlays.size() == 1);
}

TEST_CASE("Workspace: cancel stops the active run") {
    TestWorkspace tw;
    tw.write("skills.json", R"({"skills": [{"name": "build", "command": "sleep 30"}]})");
    auto ws = tw.open();

    std::thread canceller([&ws]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        ws->cancel();
    });
    auto report = ws->run("build", {"tool"}, ws->default_run_options());
    canceller.join();

    REQUIRE(report.isOk());
    CHECK(report.value().summary.status == RunStatus::Cancelled);
    CHECK(report.value().summary.find("tool")->kind == OutcomeKind::SkippedCancelled);
}

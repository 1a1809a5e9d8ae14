#include <doctest/doctest.h>
#include <wsk/manifest.hpp>
#include <wsk/platform.hpp>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace wsk;

class ManifestTempDir {
public:
    ManifestTempDir() {
        base_path_ = fs::temp_directory_path() / ("wsk_manifest_test_" + generate_uuid());
        fs::create_directories(base_path_);
    }

    ~ManifestTempDir() {
        std::error_code ec;
        fs::remove_all(base_path_, ec);
    }

    std::string root() const { return base_path_.string(); }

    std::string write(const std::string& rel, const std::string& content) {
        fs::path p = base_path_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p) << content;
        return p.string();
    }

private:
    fs::path base_path_;
};

// ============================================================================
// Package Manifests
// ============================================================================

TEST_CASE("parse_package_manifest: single package") {
    auto parsed = parse_package_manifest(R"({
        "name": "core",
        "path": "libs/core",
        "dependencies": ["base"],
        "capabilities": ["build", "test", "lint"],
        "metadata": {"owner": "platform", "tier": 1}
    })", "core/wsk_package.json");

    REQUIRE(parsed.ok);
    REQUIRE(parsed.value.size() == 1);
    const Package& p = parsed.value[0];
    CHECK(p.name == "core");
    CHECK(p.path == "libs/core");
    CHECK(p.dependencies == std::vector<std::string>{"base"});
    CHECK(p.has_capability("lint"));
    CHECK(p.metadata.at("owner") == "platform");
    CHECK(p.metadata.count("tier") == 0);
    CHECK(p.source_path == "core/wsk_package.json");
}

TEST_CASE("parse_package_manifest: packages array") {
    auto parsed = parse_package_manifest(R"({"packages": [
        {"name": "core", "capabilities": ["build"]},
        {"name": "tool", "dependencies": ["core"], "capabilities": ["build"]}
    ]})");
    REQUIRE(parsed.ok);
    CHECK(parsed.value.size() == 2);
    CHECK(parsed.value[1].dependencies == std::vector<std::string>{"core"});
}

TEST_CASE("parse_package_manifest: errors and warnings") {
    CHECK_FALSE(parse_package_manifest("{").ok);
    CHECK_FALSE(parse_package_manifest(R"({"dependencies": []})").ok);
    CHECK_FALSE(parse_package_manifest(R"({"packages": {}})").ok);

    auto warned = parse_package_manifest(R"({"name": "x", "dependencies": ["a", 3]})");
    REQUIRE(warned.ok);
    CHECK(warned.value[0].dependencies == std::vector<std::string>{"a"});
    CHECK(warned.warnings.size() == 1);
}

// ============================================================================
// Skill Catalog
// ============================================================================

TEST_CASE("parse_skill_catalog: full skill entry") {
    auto parsed = parse_skill_catalog(R"({"skills": [{
        "name": "lint",
        "description": "Static checks",
        "command": ["lint-tool", "--strict", "{package_path}"],
        "requires": ["lint"],
        "success_exit_codes": [0, 3],
        "timeout_ms": 60000,
        "working_directory": "{workspace}",
        "environment": {
            "LINT_STRICT": "1",
            "PATH": {"op": "prepend", "value": "/opt/lint/bin"}
        },
        "classifiers": [
            {"pattern": "warning:", "category": "lint violations found"},
            {"pattern": "0 files checked", "category": "nothing checked",
             "stream": "stdout", "outcome": "failure"}
        ]
    }]})");

    REQUIRE(parsed.ok);
    REQUIRE(parsed.value.size() == 1);
    const Skill& s = parsed.value[0];
    CHECK(s.name == "lint");
    CHECK(s.description == "Static checks");
    CHECK(s.command.size() == 3);
    CHECK(s.requires_capabilities == std::vector<std::string>{"lint"});
    CHECK(s.success_exit_codes == std::vector<int>{0, 3});
    REQUIRE(s.timeout.has_value());
    CHECK(s.timeout->count() == 60000);
    CHECK(s.working_directory == "{workspace}");
    CHECK(s.environment.at("LINT_STRICT") == EnvValue("1"));
    CHECK(s.environment.at("PATH").op == EnvOp::Prepend);
    REQUIRE(s.classifiers.size() == 2);
    CHECK_FALSE(s.classifiers[0].force_failure);
    CHECK(s.classifiers[0].stream == ClassifierStream::Any);
    CHECK(s.classifiers[1].force_failure);
    CHECK(s.classifiers[1].stream == ClassifierStream::Stdout);
}

TEST_CASE("parse_skill_catalog: string command runs through the shell") {
    auto parsed = parse_skill_catalog(R"({"skills": [{"name": "build", "command": "make -j4"}]})");
    REQUIRE(parsed.ok);
    CHECK(parsed.value[0].command == std::vector<std::string>{"/bin/sh", "-c", "make -j4"});
    CHECK(parsed.value[0].working_directory == "{package_path}");
    CHECK_FALSE(parsed.value[0].timeout.has_value());
}

TEST_CASE("parse_skill_catalog: rejects malformed catalogs") {
    CHECK_FALSE(parse_skill_catalog(R"({"skills": {}})").ok);
    CHECK_FALSE(parse_skill_catalog(R"({"skills": [{"command": ["x"]}]})").ok);
    CHECK_FALSE(parse_skill_catalog(R"({"skills": [{"name": "x"}]})").ok);
    CHECK_FALSE(parse_skill_catalog("nope").ok);
}

// ============================================================================
// Loading From Disk
// ============================================================================

TEST_CASE("load_manifests: discovers manifests under directories") {
    ManifestTempDir dir;
    dir.write("packages/core/wsk_package.json", R"({"name": "core", "capabilities": ["build"]})");
    dir.write("packages/tools/cli/wsk_package.json",
              R"({"name": "cli", "dependencies": ["core"], "capabilities": ["build"]})");
    dir.write("packages/core/README.md", "not a manifest");
    dir.write("extra.json", R"({"packages": [{"name": "docs", "path": "docs"}]})");

    auto loaded = load_manifests({"packages", "extra.json"}, dir.root());
    REQUIRE(loaded.isOk());
    const auto& pkgs = loaded.value();
    REQUIRE(pkgs.size() == 3);

    CHECK(pkgs[0].name == "core");
    CHECK(pkgs[0].path == "packages/core");
    CHECK(pkgs[1].name == "cli");
    CHECK(pkgs[1].path == "packages/tools/cli");
    CHECK(pkgs[2].name == "docs");
    CHECK(pkgs[2].path == "docs");
}

TEST_CASE("load_manifests: failures carry the offending location") {
    ManifestTempDir dir;

    SUBCASE("missing location") {
        auto loaded = load_manifests({"nowhere"}, dir.root());
        REQUIRE(loaded.isErr());
        CHECK(loaded.error().code() == ErrorCode::FILE_NOT_FOUND);
    }

    SUBCASE("broken manifest") {
        auto file = dir.write("bad/wsk_package.json", R"({"name": )");
        auto loaded = load_manifests({"bad"}, dir.root());
        REQUIRE(loaded.isErr());
        CHECK(loaded.error().code() == ErrorCode::INVALID_MANIFEST);
        CHECK(loaded.error().message().find("wsk_package.json") != std::string::npos);
    }
}

TEST_CASE("load_skill_catalog: missing and invalid files") {
    ManifestTempDir dir;
    auto missing = load_skill_catalog(dir.root() + "/skills.json");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::FILE_NOT_FOUND);

    auto bad = dir.write("skills.json", R"({"skills": [{"name": "x"}]})");
    auto invalid = load_skill_catalog(bad);
    REQUIRE(invalid.isErr());
    CHECK(invalid.error().code() == ErrorCode::INVALID_SKILL);
}

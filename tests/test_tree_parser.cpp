#include <catch2/catch.hpp>
#include <spmsift/tree_parser.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace spmsift;

static std::string fixture_dir() {
    const char* src = std::getenv("SPMSIFT_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

static std::string read_file(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static PackageAnalysis parse_ok(const std::string& input) {
    auto r = parse_show_dependencies(input);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

// ===== Line classification =====

TEST_CASE("classify blank and header lines", "[tree_parser]") {
    REQUIRE(classify_tree_line("", 1).kind == TreeLineKind::Blank);
    REQUIRE(classify_tree_line("   \t", 1).kind == TreeLineKind::Blank);
    REQUIRE(classify_tree_line("Dependencies:", 1).kind == TreeLineKind::Header);
    REQUIRE(classify_tree_line("Package: Demo", 1).kind == TreeLineKind::Header);
    REQUIRE(classify_tree_line("No dependencies found", 1).kind == TreeLineKind::Header);
}

TEST_CASE("classify diagnostic lines", "[tree_parser]") {
    auto err = classify_tree_line("error: something went wrong", 3);
    REQUIRE(err.kind == TreeLineKind::Diagnostic);
    REQUIRE(err.issue->kind == IssueKind::DependencyError);
    REQUIRE(err.issue->severity == Severity::Error);
    REQUIRE(err.issue->message == "error: something went wrong");
    REQUIRE(err.issue->line == std::optional<int>(3));

    auto warn = classify_tree_line("Warning: deprecated API", 7);
    REQUIRE(warn.kind == TreeLineKind::Diagnostic);
    REQUIRE(warn.issue->severity == Severity::Warning);

    auto failed = classify_tree_line("fetch FAILED", 1);
    REQUIRE(failed.kind == TreeLineKind::Diagnostic);
    REQUIRE(failed.issue->severity == Severity::Warning);
}

TEST_CASE("classify dependency lines", "[tree_parser]") {
    auto tl = classify_tree_line("├── Alamofire (5.8.1)", 2);
    REQUIRE(tl.kind == TreeLineKind::Dependency);
    REQUIRE(tl.dependency->name == "Alamofire");
    REQUIRE(tl.dependency->version == "5.8.1");
}

TEST_CASE("classify glyph-only lines as unrecognized", "[tree_parser]") {
    REQUIRE(classify_tree_line("│", 1).kind == TreeLineKind::Unrecognized);
    REQUIRE(classify_tree_line("├──", 1).kind == TreeLineKind::Unrecognized);
}

// ===== Whole input =====

TEST_CASE("parse empty input", "[tree_parser]") {
    auto result = parse_ok("");
    REQUIRE(result.command == CommandKind::ShowDependencies);
    REQUIRE(result.success);
    REQUIRE(result.dependencies.has_value());
    REQUIRE(result.dependencies->count == 0);
    REQUIRE_FALSE(result.dependencies->circular_imports);
    REQUIRE(result.issues.empty());
    REQUIRE_FALSE(result.targets.has_value());
}

TEST_CASE("parse nested tree fixture", "[tree_parser]") {
    auto result = parse_ok(read_file(fixture_dir() + "/show_dependencies_nested.txt"));
    REQUIRE(result.success);
    REQUIRE(result.issues.empty());

    const auto& deps = *result.dependencies;
    REQUIRE(deps.count == 4);
    REQUIRE(deps.external.size() == 4);
    REQUIRE(deps.local.empty());
    REQUIRE_FALSE(deps.circular_imports);

    REQUIRE(deps.external[0].name == "swift-argument-parser");
    REQUIRE(*deps.external[0].url == "https://github.com/apple/swift-argument-parser");
    REQUIRE(deps.external[0].version == "1.3.0");
    REQUIRE(deps.external[2].name == "swift-atomics");
    REQUIRE(deps.external[3].name == "swift-collections");
    for (const auto& dep : deps.external) {
        REQUIRE(dep.kind == DependencyKind::SourceControl);
    }
}

TEST_CASE("parse conflict fixture", "[tree_parser]") {
    auto result = parse_ok(read_file(fixture_dir() + "/show_dependencies_conflicts.txt"));

    const auto& deps = *result.dependencies;
    REQUIRE(deps.external.size() == 5);
    REQUIRE(deps.count == 5);
    REQUIRE(deps.circular_imports);
    REQUIRE(deps.version_conflicts.size() == 1);
    REQUIRE(deps.version_conflicts[0].dependency == "swift-collections");
    std::vector<std::string> expected{"1.0.5", "1.1.0"};
    REQUIRE(deps.version_conflicts[0].required_versions == expected);

    REQUIRE(result.issues.size() == 3);
    REQUIRE(result.issues[0].kind == IssueKind::VersionConflict);
    REQUIRE(result.issues[0].severity == Severity::Warning);
    REQUIRE(result.issues[0].message == "Multiple versions of swift-collections: 1.0.5, 1.1.0");
    REQUIRE(result.issues[1].severity == Severity::Info);
    REQUIRE(result.issues[1].message == "Using branch 'develop' may cause instability");
    REQUIRE(result.issues[1].target == std::optional<std::string>("Quick"));
    REQUIRE(result.issues[2].kind == IssueKind::CircularImport);
    REQUIRE(result.issues[2].severity == Severity::Error);

    REQUIRE_FALSE(result.success);
}

TEST_CASE("version conflict message lists versions in first-seen order", "[tree_parser]") {
    auto result = parse_ok(
        "Dependencies:\n"
        "├─ Alamofire (5.0.0)\n"
        "└─ Alamofire (4.9.0)\n");

    REQUIRE(result.dependencies->version_conflicts.size() == 1);
    bool found = false;
    for (const auto& issue : result.issues) {
        if (issue.kind == IssueKind::VersionConflict &&
            issue.message == "Multiple versions of Alamofire: 5.0.0, 4.9.0") {
            REQUIRE(issue.severity == Severity::Warning);
            found = true;
        }
    }
    REQUIRE(found);
}

TEST_CASE("repeated name with the same version is not a conflict", "[tree_parser]") {
    auto result = parse_ok(
        "├─ swift-log (1.5.4)\n"
        "│  └─ swift-log (1.5.4)\n");
    REQUIRE(result.dependencies->version_conflicts.empty());
    REQUIRE(result.dependencies->circular_imports);
    REQUIRE_FALSE(result.success);
}

TEST_CASE("branch tracking versions get an info issue", "[tree_parser]") {
    auto result = parse_ok(
        "├─ A@main\n"
        "├─ B@master\n"
        "└─ C@1.0.0\n");
    int branch_notes = 0;
    for (const auto& issue : result.issues) {
        if (issue.severity == Severity::Info) ++branch_notes;
    }
    REQUIRE(branch_notes == 2);
    REQUIRE(result.success);
}

TEST_CASE("error lines are counted and fail the parse", "[tree_parser]") {
    auto result = parse_ok(
        "Dependencies:\n"
        "├─ Alamofire (5.8.1)\n"
        "error: unable to load package graph\n");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.issues.size() == 1);
    REQUIRE(result.issues[0].kind == IssueKind::DependencyError);
    REQUIRE(result.issues[0].line == std::optional<int>(3));
    REQUIRE(result.dependencies->count == 1);
}

TEST_CASE("warnings do not fail the parse", "[tree_parser]") {
    auto result = parse_ok(
        "warning: 'swift-tools-version' is outdated\n"
        "├─ Alamofire (5.8.1)\n");
    REQUIRE(result.success);
    REQUIRE(result.issues.size() == 1);
    REQUIRE(result.issues[0].severity == Severity::Warning);
}

TEST_CASE("bare names become local dependencies", "[tree_parser]") {
    auto result = parse_ok(
        "├─ Alamofire (5.8.1)\n"
        "└─ MyLocalPackage\n");
    const auto& deps = *result.dependencies;
    REQUIRE(deps.external.size() == 1);
    REQUIRE(deps.local.size() == 1);
    REQUIRE(deps.local[0].name == "MyLocalPackage");
    REQUIRE(deps.local[0].path == "MyLocalPackage");
    REQUIRE(deps.count == 2);
}

TEST_CASE("bracket and built-in forms are external", "[tree_parser]") {
    auto result = parse_ok(
        "├── SQLiteData [local]\n"
        "└── Foundation (built-in)\n");
    const auto& deps = *result.dependencies;
    REQUIRE(deps.external.size() == 2);
    REQUIRE(deps.external[0].name == "SQLiteData");
    REQUIRE(*deps.external[0].url == "local");
    REQUIRE(deps.external[1].version == "built-in");
    REQUIRE(deps.local.empty());
}

TEST_CASE("circular keyword anywhere marks the graph", "[tree_parser]") {
    auto result = parse_ok(
        "├─ A (1.0.0)\n"
        "└─ B (1.0.0) -- cycle\n");
    REQUIRE(result.dependencies->circular_imports);
    REQUIRE(result.issues.back().message == "Circular dependency detected in package graph");
    REQUIRE_FALSE(result.success);
}

TEST_CASE("count always equals external plus local", "[tree_parser]") {
    const char* inputs[] = {
        "",
        "├─ A (1.0.0)\n└─ B\n",
        "A@1.0.0\nB [local]\nC<https://x/c@2.0.0>\nD\n",
        "Dependencies:\n│\n├─ A (1.0.0)\n",
    };
    for (const char* input : inputs) {
        auto result = parse_ok(input);
        const auto& deps = *result.dependencies;
        REQUIRE(deps.count == static_cast<int>(deps.external.size() + deps.local.size()));
    }
}

TEST_CASE("blank lines never trigger circular detection", "[tree_parser]") {
    auto result = parse_ok("\n\n│\n│\n├─ A (1.0.0)\n\n");
    REQUIRE_FALSE(result.dependencies->circular_imports);
    REQUIRE(result.success);
}

TEST_CASE("tree: invalid UTF-8 is an encoding error", "[tree_parser]") {
    auto r = parse_show_dependencies("├─ A (1.0.0)\n\xff\xfe\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SiftError::Encoding);
}

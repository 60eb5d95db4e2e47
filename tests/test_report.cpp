#include <catch2/catch.hpp>
#include <spmsift/report.hpp>

using namespace spmsift;

static PackageAnalysis sized(int targets, int deps, int issues) {
    PackageAnalysis a;
    a.command = CommandKind::DumpPackage;
    a.success = true;
    a.targets = TargetAnalysis{};
    a.targets->count = targets;
    a.dependencies = DependencyAnalysis{};
    a.dependencies->count = deps;
    for (int i = 0; i < issues; ++i) {
        a.issues.push_back(make_issue(IssueKind::Unknown, Severity::Info, "note"));
    }
    return a;
}

// ===== Severity filter =====

TEST_CASE("filter_issues keeps issues at or above the minimum", "[report]") {
    std::vector<PackageIssue> issues{
        make_issue(IssueKind::Unknown, Severity::Info, "i"),
        make_issue(IssueKind::Unknown, Severity::Critical, "c"),
        make_issue(IssueKind::Unknown, Severity::Warning, "w"),
        make_issue(IssueKind::Unknown, Severity::Error, "e"),
    };

    REQUIRE(filter_issues(issues, Severity::Info).size() == 4);

    auto warnings = filter_issues(issues, Severity::Warning);
    REQUIRE(warnings.size() == 3);
    REQUIRE(warnings[0].message == "c");
    REQUIRE(warnings[1].message == "w");
    REQUIRE(warnings[2].message == "e");

    auto critical = filter_issues(issues, Severity::Critical);
    REQUIRE(critical.size() == 1);
    REQUIRE(critical[0].message == "c");
}

// ===== Metrics =====

TEST_CASE("complexity buckets", "[report]") {
    REQUIRE(estimate_complexity(sized(0, 0, 0)) == Complexity::Low);
    REQUIRE(estimate_complexity(sized(10, 5, 2)) == Complexity::Low);
    REQUIRE(estimate_complexity(sized(11, 6, 3)) == Complexity::Medium);
    REQUIRE(estimate_complexity(sized(30, 15, 10)) == Complexity::Medium);
    REQUIRE(estimate_complexity(sized(31, 15, 10)) == Complexity::High);
}

TEST_CASE("complexity between buckets is high", "[report]") {
    // Few targets but many dependencies fits neither range
    REQUIRE(estimate_complexity(sized(5, 8, 0)) == Complexity::High);
}

TEST_CASE("complexity counts missing sections as zero", "[report]") {
    PackageAnalysis a;
    REQUIRE(estimate_complexity(a) == Complexity::Low);
}

TEST_CASE("index time buckets", "[report]") {
    REQUIRE(estimate_index_time(sized(0, 0, 0)) == "5-15s");
    REQUIRE(estimate_index_time(sized(19, 0, 0)) == "5-15s");
    REQUIRE(estimate_index_time(sized(0, 10, 0)) == "15-45s");
    REQUIRE(estimate_index_time(sized(49, 0, 0)) == "15-45s");
    REQUIRE(estimate_index_time(sized(10, 20, 0)) == "45-90s");
    REQUIRE(estimate_index_time(sized(0, 50, 0)) == "90s+");
}

TEST_CASE("compute_metrics", "[report]") {
    auto m = compute_metrics(sized(3, 2, 0), 0.25);
    REQUIRE(m.parse_time == Approx(0.25));
    REQUIRE(m.complexity == Complexity::Low);
    REQUIRE(m.estimated_index_time == std::optional<std::string>("5-15s"));
}

// ===== Output =====

TEST_CASE("summary_json has counts only", "[report]") {
    auto j = summary_json(sized(3, 2, 1));
    REQUIRE(j["command"] == "dump-package");
    REQUIRE(j["success"] == true);
    REQUIRE(j["targets"] == 3);
    REQUIRE(j["dependencies"] == 2);
    REQUIRE(j["issues"] == 1);
}

TEST_CASE("summary_json omits absent sections and empty issues", "[report]") {
    PackageAnalysis a;
    a.command = CommandKind::Resolve;
    auto j = summary_json(a);
    REQUIRE(j.size() == 2);
    REQUIRE_FALSE(j.contains("targets"));
    REQUIRE_FALSE(j.contains("dependencies"));
    REQUIRE_FALSE(j.contains("issues"));
}

TEST_CASE("render formats", "[report]") {
    auto a = sized(1, 1, 0);
    auto summary = nlohmann::json::parse(render(a, OutputFormat::Summary));
    REQUIRE(summary["targets"] == 1);
    REQUIRE_FALSE(summary.contains("issues"));

    auto full = nlohmann::json::parse(render(a, OutputFormat::Json));
    REQUIRE(full["targets"]["count"] == 1);
    REQUIRE(full["issues"].is_array());

    REQUIRE(render(a, OutputFormat::Detailed) == render(a, OutputFormat::Json));
}

TEST_CASE("parse_output_format", "[report]") {
    REQUIRE(parse_output_format("json").value() == OutputFormat::Json);
    REQUIRE(parse_output_format("summary").value() == OutputFormat::Summary);
    REQUIRE(parse_output_format("detailed").value() == OutputFormat::Detailed);
    for (auto f : {OutputFormat::Json, OutputFormat::Summary, OutputFormat::Detailed}) {
        REQUIRE(parse_output_format(output_format_name(f)).value() == f);
    }

    auto bad = parse_output_format("yaml");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == SiftError::InvalidArg);
}

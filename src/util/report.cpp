#include <spmsift/report.hpp>
#include <spmsift/serialize.hpp>

namespace spmsift {

const char* output_format_name(OutputFormat f) {
    switch (f) {
        case OutputFormat::Json:     return "json";
        case OutputFormat::Summary:  return "summary";
        case OutputFormat::Detailed: return "detailed";
    }
    return "json";
}

Result<OutputFormat> parse_output_format(const std::string& name) {
    if (name == "json") return Result<OutputFormat>::ok(OutputFormat::Json);
    if (name == "summary") return Result<OutputFormat>::ok(OutputFormat::Summary);
    if (name == "detailed") return Result<OutputFormat>::ok(OutputFormat::Detailed);
    return SiftError{SiftError::InvalidArg,
        "unknown output format '" + name + "'",
        "expected one of: json, summary, detailed"};
}

std::vector<PackageIssue> filter_issues(const std::vector<PackageIssue>& issues,
                                        Severity minimum) {
    std::vector<PackageIssue> kept;
    for (const auto& issue : issues) {
        if (severity_at_least(issue.severity, minimum)) kept.push_back(issue);
    }
    return kept;
}

static int target_count(const PackageAnalysis& a) {
    return a.targets ? a.targets->count : 0;
}

static int dependency_count(const PackageAnalysis& a) {
    return a.dependencies ? a.dependencies->count : 0;
}

static bool in_range(int v, int lo, int hi) {
    return v >= lo && v <= hi;
}

Complexity estimate_complexity(const PackageAnalysis& a) {
    int targets = target_count(a);
    int deps = dependency_count(a);
    int issues = static_cast<int>(a.issues.size());

    if (in_range(targets, 0, 10) && in_range(deps, 0, 5) && in_range(issues, 0, 2)) {
        return Complexity::Low;
    }
    if (in_range(targets, 11, 30) && in_range(deps, 6, 15) && in_range(issues, 3, 10)) {
        return Complexity::Medium;
    }
    return Complexity::High;
}

std::string estimate_index_time(const PackageAnalysis& a) {
    int weight = target_count(a) + dependency_count(a) * 2;
    if (weight < 20) return "5-15s";
    if (weight < 50) return "15-45s";
    if (weight < 100) return "45-90s";
    return "90s+";
}

PackageMetrics compute_metrics(const PackageAnalysis& a, double parse_seconds) {
    PackageMetrics m;
    m.parse_time = parse_seconds;
    m.complexity = estimate_complexity(a);
    m.estimated_index_time = estimate_index_time(a);
    return m;
}

nlohmann::json summary_json(const PackageAnalysis& a) {
    nlohmann::json j;
    j["command"] = command_name(a.command);
    j["success"] = a.success;
    if (a.targets) j["targets"] = a.targets->count;
    if (a.dependencies) j["dependencies"] = a.dependencies->count;
    if (!a.issues.empty()) j["issues"] = a.issues.size();
    return j;
}

std::string render(const PackageAnalysis& a, OutputFormat format) {
    switch (format) {
        case OutputFormat::Summary:
            return summary_json(a).dump(2);
        case OutputFormat::Json:
        case OutputFormat::Detailed:
            return to_json_string(a, 2);
    }
    return to_json_string(a, 2);
}

} // namespace spmsift

#pragma once

#include <spmsift/analysis.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace spmsift {

enum class OutputFormat {
    Json,       // full result
    Summary,    // command, success and counts only
    Detailed,   // full result (kept distinct for callers that ask for it)
};

const char* output_format_name(OutputFormat f);
Result<OutputFormat> parse_output_format(const std::string& name);

// Keep issues at or above `minimum`, preserving order
std::vector<PackageIssue> filter_issues(const std::vector<PackageIssue>& issues,
                                        Severity minimum);

// Coarse bucket from target, dependency and issue counts:
//   low    targets <= 10,    deps <= 5,    issues <= 2
//   medium targets 11..30,   deps 6..15,   issues 3..10
//   high   everything else
Complexity estimate_complexity(const PackageAnalysis& a);

// "5-15s", "15-45s", "45-90s" or "90s+" from targets + 2 * dependencies
std::string estimate_index_time(const PackageAnalysis& a);

PackageMetrics compute_metrics(const PackageAnalysis& a, double parse_seconds);

// {"command", "success", "targets"?, "dependencies"?, "issues"?} where the
// optional keys hold counts and "issues" is omitted when there are none
nlohmann::json summary_json(const PackageAnalysis& a);

// Pretty-printed output in the requested format
std::string render(const PackageAnalysis& a, OutputFormat format);

} // namespace spmsift

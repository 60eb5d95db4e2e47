#pragma once

#include <spmsift/analysis.hpp>
#include <optional>
#include <string>

namespace spmsift {

// How the show-dependencies line policy treated one input line
enum class TreeLineKind {
    Blank,          // empty after trimming
    Header,         // "Dependencies:", "Package:", "no dependencies"
    Diagnostic,     // mentions error / failed / warning
    Dependency,     // accepted by the dependency-line grammar
    LocalPath,      // rejected by the grammar but looks like a path
    Unrecognized,   // anything else (e.g. a line of bare tree glyphs)
};

const char* tree_line_kind_name(TreeLineKind k);

struct TreeLine {
    TreeLineKind kind = TreeLineKind::Blank;
    std::string text;                               // trimmed line
    std::optional<ExternalDependency> dependency;   // kind == Dependency
    std::optional<LocalDependency> local;           // kind == LocalPath
    std::optional<PackageIssue> issue;              // kind == Diagnostic
};

// Apply the per-line policy to one raw line. `line_number` is 1-based and
// is recorded on diagnostic issues.
TreeLine classify_tree_line(const std::string& raw, int line_number);

// Parse the complete output of `swift package show-dependencies`.
// Fails only when the input is not valid UTF-8; every other problem is
// reported as an issue on the returned analysis.
Result<PackageAnalysis> parse_show_dependencies(const std::string& input);

} // namespace spmsift

#pragma once

#include <spmsift/analysis.hpp>
#include <optional>
#include <string>

namespace spmsift {

struct AnalyzeOptions {
    // Skip detection and treat the input as this sub-command's output
    std::optional<CommandKind> command;
    // Single-target filter for dump-package
    std::optional<std::string> target;
};

// Full pipeline for one captured output: detect the sub-command, short-cut
// on error markers, then run the matching parser. Always returns an
// analysis; parser hard failures become a single syntax_error issue.
PackageAnalysis analyze(const std::string& input, const AnalyzeOptions& options = {});

} // namespace spmsift

#pragma once

#include <spmsift/analysis.hpp>
#include <string>

namespace spmsift {

// Keyword scanners for the sub-commands whose output has no structure worth
// a grammar. Each looks at one trimmed line at a time and never fails.

// `swift package resolve`: resolved package names, failures, network
// problems, requirement conflicts, and the summed download time (reported
// as metrics.estimatedIndexTime).
PackageAnalysis scan_resolve(const std::string& input);

// `swift package update`: updated package names and failures
PackageAnalysis scan_update(const std::string& input);

// `swift package describe`: succeeds when a "Package Name:" line is present
PackageAnalysis scan_describe(const std::string& input);

} // namespace spmsift

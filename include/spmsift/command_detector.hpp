#pragma once

#include <spmsift/analysis.hpp>
#include <string>
#include <vector>

namespace spmsift {

// Guess which sub-command produced `output` by keyword sniffing.
// Case-insensitive; checked in this order:
//   "name" and "targets" keys            -> DumpPackage
//   tree glyphs (├─ └─ │)                -> ShowDependencies
//   resolving/fetching/resolved/updating -> Resolve
//   package name:/package version:       -> Describe
//   updating/updated/checking out        -> Update
CommandKind detect_command(const std::string& output);

// True if the output carries an error marker: "error:", "failed", "cannot",
// "unable to" or "invalid" (any case).
bool has_error_output(const std::string& output);

// Trimmed lines containing "error:" or starting with "error" (any case)
std::vector<std::string> extract_error_messages(const std::string& output);

} // namespace spmsift

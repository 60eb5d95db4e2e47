#pragma once

#include <spmsift/analysis.hpp>
#include <optional>
#include <string>

namespace spmsift {

// Grammar for one line of `swift package show-dependencies` text output.
//
// After stripping the leading run of box-drawing glyphs and spaces, the first
// matching form wins:
//
//   1. "name (VERSION)"          version typed by classify_version()
//   2. "name@VERSION"            same; only an '@' before any '<' counts
//   3. "name [URL]"              version "source-control", url = URL
//   4. "name<URL@VERSION>"       url/version split on the first '@';
//                                version "unspecified" without one
//   5. "name"                    version "unspecified"
//
// Forms 3-5 are always source-control. Returns nullopt for lines that are
// empty after stripping, or whose name part is empty.
std::optional<ExternalDependency> parse_dependency_line(const std::string& line);

// Version-type heuristic for forms 1 and 2:
//   contains "registry", or starts with "1.", "2." or "3."  -> Registry
//   contains ".binary", or "xcframework" in any case         -> Binary
//   otherwise                                               -> SourceControl
DependencyKind classify_version(const std::string& version);

} // namespace spmsift

#pragma once

#include <spmsift/analysis.hpp>
#include <optional>
#include <string>

namespace spmsift {

// Parse the JSON printed by `swift package dump-package`.
//
// Both manifest schemas are accepted:
//   - current: dependencies wrapped as {"sourceControl": [{...}]} or
//     {"fileSystem": [{...}]}, with optional values encoded as zero- or
//     one-element arrays;
//   - legacy: flat {"name", "url" | "path", "requirement"} objects.
//
// With `target_filter`, only that target is summarised, only package
// dependencies it references are kept, and issues attached to other targets
// are dropped.
//
// Malformed JSON is reported as a syntax_error issue on a failed analysis.
// Returns an error only for input that is not valid UTF-8 (Encoding) or a
// JSON document whose root is not an object (Parse).
Result<PackageAnalysis> parse_dump_package(
    const std::string& input,
    const std::optional<std::string>& target_filter = std::nullopt);

} // namespace spmsift

#pragma once

#include <string>
#include <vector>

namespace spmsift::text {

// Strip leading/trailing ASCII whitespace (space, tab, CR, LF, VT, FF)
std::string trim(const std::string& s);

// ASCII lowercase; multi-byte UTF-8 sequences pass through unchanged
std::string to_lower(const std::string& s);

bool contains(const std::string& s, const std::string& needle);
bool contains_ci(const std::string& s, const std::string& needle);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Split on '\n'. A trailing newline does not produce an extra empty line.
std::vector<std::string> split_lines(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

bool is_valid_utf8(const std::string& s);

// Box-drawing glyphs used by `swift package show-dependencies`:
// U+2502 (│), U+251C (├), U+2514 (└), U+2500 (─).
// Returns the byte length of the glyph at `pos`, or 0 if none starts there.
size_t tree_glyph_at(const std::string& s, size_t pos);

// Remove the leading run of tree glyphs and spaces
std::string strip_tree_prefix(const std::string& s);

} // namespace spmsift::text

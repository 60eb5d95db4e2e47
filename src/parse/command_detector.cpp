#include <spmsift/command_detector.hpp>
#include <spmsift/text.hpp>

#include <initializer_list>

namespace spmsift {

static bool contains_any(const std::string& s, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (text::contains(s, n)) return true;
    }
    return false;
}

CommandKind detect_command(const std::string& output) {
    std::string lower = text::to_lower(output);

    if (text::contains(lower, "\"name\"") && text::contains(lower, "\"targets\"")) {
        return CommandKind::DumpPackage;
    }
    if (contains_any(lower, {"├─", "└─", "│"})) {
        return CommandKind::ShowDependencies;
    }
    if (contains_any(lower, {"resolving", "fetching", "resolved", "updating"})) {
        return CommandKind::Resolve;
    }
    if (contains_any(lower, {"package name:", "package version:"})) {
        return CommandKind::Describe;
    }
    // "updating" already matched Resolve above; kept so the keyword set reads
    // the same as the update scanner's.
    if (contains_any(lower, {"updating", "updated", "checking out"})) {
        return CommandKind::Update;
    }
    return CommandKind::Unknown;
}

bool has_error_output(const std::string& output) {
    return contains_any(text::to_lower(output),
                        {"error:", "failed", "cannot", "unable to", "invalid"});
}

std::vector<std::string> extract_error_messages(const std::string& output) {
    std::vector<std::string> errors;
    for (const auto& line : text::split_lines(output)) {
        std::string trimmed = text::trim(line);
        std::string lower = text::to_lower(trimmed);
        if (text::contains(lower, "error:") || text::starts_with(lower, "error")) {
            errors.push_back(trimmed);
        }
    }
    return errors;
}

} // namespace spmsift

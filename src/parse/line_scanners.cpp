#include <spmsift/line_scanners.hpp>
#include <spmsift/log.hpp>
#include <spmsift/text.hpp>

#include <cctype>
#include <cstdio>
#include <optional>
#include <stdexcept>

namespace spmsift {

// ---------------------------------------------------------------------------
// resolve
// ---------------------------------------------------------------------------

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// First `<keyword> <token>` in the line, keyword matched case-insensitively.
// Keywords are tried in order; the token is the run of non-space bytes after
// exactly one space.
static std::optional<std::string> resolve_package_name(const std::string& line) {
    static const char* const keywords[] = {
        "resolving ", "resolved ", "error: ", "failed to resolve ",
    };

    std::string lower = text::to_lower(line);
    for (const char* keyword : keywords) {
        std::string kw = keyword;
        for (size_t at = lower.find(kw); at != std::string::npos;
             at = lower.find(kw, at + 1)) {
            size_t begin = at + kw.size();
            size_t end = begin;
            while (end < line.size() && !is_space(line[end])) ++end;
            if (end > begin) return line.substr(begin, end - begin);
        }
    }
    return std::nullopt;
}

// Offset just past `unit` if it follows `pos` after optional whitespace
static std::optional<size_t> unit_after(const std::string& line, size_t pos,
                                        const std::string& unit) {
    while (pos < line.size() && is_space(line[pos])) ++pos;
    if (line.compare(pos, unit.size(), unit) != 0) return std::nullopt;
    return pos + unit.size();
}

// Leftmost number followed by `unit`. Fractions are accepted only when
// `fraction` is set. Returns the digits as written.
static std::optional<std::string> number_before(const std::string& line,
                                                const std::string& unit,
                                                bool fraction) {
    size_t i = 0;
    while (i < line.size()) {
        if (!is_digit(line[i])) { ++i; continue; }

        size_t begin = i;
        while (i < line.size() && is_digit(line[i])) ++i;
        size_t end = i;
        if (fraction && end < line.size() && line[end] == '.') {
            ++end;
            while (end < line.size() && is_digit(line[end])) ++end;
        }
        if (unit_after(line, end, unit)) return line.substr(begin, end - begin);
        // Digits after a '.' may still start a match: "1.2.3 seconds" is 2.3
        i = (end > i) ? i + 1 : end;
    }
    return std::nullopt;
}

// "Downloaded in 2.3 seconds" or "Took 150ms"
static double download_seconds(const std::string& line) {
    try {
        if (auto secs = number_before(line, "second", true)) {
            return std::stod(*secs);
        }
        if (auto millis = number_before(line, "ms", false)) {
            return std::stod(*millis) / 1000.0;
        }
    } catch (const std::out_of_range&) {
        log::debug("resolve: ignoring oversized duration (%zu bytes)", line.size());
    }
    return 0.0;
}

PackageAnalysis scan_resolve(const std::string& input) {
    std::vector<PackageIssue> issues;
    std::vector<std::string> resolved;
    bool failed = false;
    bool completed = false;
    double download_time = 0.0;

    for (const auto& raw : text::split_lines(input)) {
        std::string line = text::trim(raw);
        std::string lower = text::to_lower(line);

        if (text::contains(raw, "Resolve completed") ||
            text::contains(raw, "All packages resolved")) {
            completed = true;
        }

        if (text::contains(line, "resolved") || text::contains(line, "Resolved")) {
            if (auto name = resolve_package_name(line)) resolved.push_back(*name);
        }

        if (text::contains(lower, "error") || text::contains(lower, "failed") ||
            text::contains(lower, "cannot resolve")) {
            failed = true;
            issues.push_back(make_issue(IssueKind::DependencyError, Severity::Error, line));
        }

        if (text::contains(line, "seconds") || text::contains(line, "ms")) {
            download_time += download_seconds(line);
        }

        if (text::contains(lower, "network") || text::contains(lower, "connection") ||
            text::contains(lower, "timeout")) {
            issues.push_back(make_issue(IssueKind::NetworkError, Severity::Error, line));
        }

        if (text::contains(lower, "conflict") || text::contains(lower, "incompatible") ||
            text::contains(lower, "requirement")) {
            issues.push_back(make_issue(IssueKind::VersionConflict, Severity::Warning, line));
        }
    }

    bool has_dependency_error = false;
    for (const auto& issue : issues) {
        if (issue.kind == IssueKind::DependencyError) has_dependency_error = true;
    }
    if (!completed && !has_dependency_error) {
        issues.push_back(make_issue(IssueKind::DependencyError, Severity::Info,
            "Resolution may not have completed successfully"));
    }

    DependencyAnalysis deps;
    for (const auto& name : resolved) {
        deps.external.push_back(ExternalDependency{
            name, "resolved", DependencyKind::SourceControl, std::nullopt});
    }
    deps.count = static_cast<int>(deps.external.size());

    PackageMetrics metrics;
    if (download_time > 0) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1fs", download_time);
        metrics.estimated_index_time = std::string(buf);
    }

    log::debug("resolve: %zu resolved, %zu issues", resolved.size(), issues.size());

    PackageAnalysis result;
    result.command = CommandKind::Resolve;
    result.success = !failed;
    result.dependencies = std::move(deps);
    result.issues = std::move(issues);
    result.metrics = std::move(metrics);
    return result;
}

// ---------------------------------------------------------------------------
// update
// ---------------------------------------------------------------------------

// First word that is not itself a status keyword
static std::optional<std::string> update_package_name(const std::string& line) {
    size_t pos = 0;
    while (pos < line.size()) {
        size_t end = line.find(' ', pos);
        if (end == std::string::npos) end = line.size();
        std::string word = line.substr(pos, end - pos);
        pos = end + 1;
        if (word.empty()) continue;
        std::string lower = text::to_lower(word);
        if (!text::contains(lower, "updated") && !text::contains(lower, "error")) {
            return word;
        }
    }
    return std::nullopt;
}

PackageAnalysis scan_update(const std::string& input) {
    std::vector<PackageIssue> issues;
    std::vector<std::string> updated;
    bool failed = false;

    for (const auto& raw : text::split_lines(input)) {
        std::string line = text::trim(raw);
        std::string lower = text::to_lower(line);

        if (text::contains(lower, "updated") || text::contains(lower, "updating")) {
            if (auto name = update_package_name(line)) updated.push_back(*name);
        }

        if (text::contains(lower, "error") || text::contains(lower, "failed") ||
            text::contains(lower, "cannot update")) {
            failed = true;
            issues.push_back(make_issue(IssueKind::DependencyError, Severity::Error, line));
        }

        if (text::contains(lower, "network") || text::contains(lower, "connection")) {
            issues.push_back(make_issue(IssueKind::NetworkError, Severity::Error, line));
        }
    }

    DependencyAnalysis deps;
    for (const auto& name : updated) {
        deps.external.push_back(ExternalDependency{
            name, "updated", DependencyKind::SourceControl, std::nullopt});
    }
    deps.count = static_cast<int>(deps.external.size());

    PackageAnalysis result;
    result.command = CommandKind::Update;
    result.success = !failed;
    result.dependencies = std::move(deps);
    result.issues = std::move(issues);
    return result;
}

// ---------------------------------------------------------------------------
// describe
// ---------------------------------------------------------------------------

static std::string value_after(const std::string& line, size_t prefix_len) {
    return text::trim(line.substr(prefix_len));
}

PackageAnalysis scan_describe(const std::string& input) {
    std::vector<PackageIssue> issues;
    std::optional<std::string> package_name;
    std::optional<std::string> package_version;
    std::vector<std::string> platforms;

    for (const auto& raw : text::split_lines(input)) {
        std::string line = text::trim(raw);
        std::string lower = text::to_lower(line);

        if (text::starts_with(lower, "package name:")) {
            package_name = value_after(line, std::string("package name:").size());
        }
        if (text::starts_with(lower, "package version:")) {
            package_version = value_after(line, std::string("package version:").size());
        }
        if (text::contains(lower, "platform:") || text::contains(lower, "platforms:")) {
            platforms.push_back(line);
        }
        if (text::contains(lower, "error")) {
            issues.push_back(make_issue(IssueKind::SyntaxError, Severity::Error, line));
        }
    }

    log::debug("describe: name=%s version=%s",
               package_name ? package_name->c_str() : "-",
               package_version ? package_version->c_str() : "-");

    PackageAnalysis result;
    result.command = CommandKind::Describe;
    result.success = package_name.has_value();
    if (!platforms.empty()) {
        TargetAnalysis targets;
        targets.platforms = std::move(platforms);
        result.targets = std::move(targets);
    }
    result.issues = std::move(issues);
    return result;
}

} // namespace spmsift

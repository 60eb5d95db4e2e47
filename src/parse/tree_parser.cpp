#include <spmsift/tree_parser.hpp>
#include <spmsift/dependency_line.hpp>
#include <spmsift/log.hpp>
#include <spmsift/text.hpp>

#include <unordered_map>
#include <unordered_set>

namespace spmsift {

// ---------------------------------------------------------------------------
// Line policy
// ---------------------------------------------------------------------------

const char* tree_line_kind_name(TreeLineKind k) {
    switch (k) {
        case TreeLineKind::Blank:        return "blank";
        case TreeLineKind::Header:       return "header";
        case TreeLineKind::Diagnostic:   return "diagnostic";
        case TreeLineKind::Dependency:   return "dependency";
        case TreeLineKind::LocalPath:    return "local-path";
        case TreeLineKind::Unrecognized: return "unrecognized";
    }
    return "unrecognized";
}

static bool is_header(const std::string& line) {
    return text::contains(line, "Dependencies:") ||
           text::contains(line, "Package:") ||
           text::contains_ci(line, "no dependencies");
}

TreeLine classify_tree_line(const std::string& raw, int line_number) {
    TreeLine out;
    out.text = text::trim(raw);
    const std::string& line = out.text;

    if (line.empty()) {
        out.kind = TreeLineKind::Blank;
        return out;
    }
    if (is_header(line)) {
        out.kind = TreeLineKind::Header;
        return out;
    }

    std::string lower = text::to_lower(line);
    bool mentions_error = text::contains(lower, "error");
    if (mentions_error || text::contains(lower, "failed") ||
        text::contains(lower, "warning")) {
        PackageIssue issue = make_issue(IssueKind::DependencyError,
            mentions_error ? Severity::Error : Severity::Warning, line);
        issue.line = line_number;
        out.kind = TreeLineKind::Diagnostic;
        out.issue = std::move(issue);
        return out;
    }

    if (auto dep = parse_dependency_line(line)) {
        out.kind = TreeLineKind::Dependency;
        out.dependency = std::move(dep);
        return out;
    }

    bool glyph_first = line[0] == ' ' || text::tree_glyph_at(line, 0) > 0;
    bool has_separator = text::contains(line, "/") || text::contains(line, "\\");
    if (!glyph_first && has_separator) {
        out.kind = TreeLineKind::LocalPath;
        out.local = LocalDependency{line, line};
        return out;
    }

    out.kind = TreeLineKind::Unrecognized;
    return out;
}

// ---------------------------------------------------------------------------
// Whole-input heuristics
// ---------------------------------------------------------------------------

// Groups by name in first-seen order. A name seen with more than one version
// is a conflict; versions tracking a moving branch get an info note.
static void check_versions(const std::vector<ExternalDependency>& deps,
                           std::vector<PackageIssue>& issues,
                           std::vector<VersionConflict>& conflicts) {
    std::vector<std::string> order;
    std::unordered_map<std::string, std::vector<const ExternalDependency*>> groups;
    for (const auto& dep : deps) {
        auto& group = groups[dep.name];
        if (group.empty()) order.push_back(dep.name);
        group.push_back(&dep);
    }

    for (const auto& name : order) {
        const auto& group = groups[name];

        std::vector<std::string> versions;
        for (const auto* dep : group) {
            bool seen = false;
            for (const auto& v : versions) {
                if (v == dep->version) { seen = true; break; }
            }
            if (!seen) versions.push_back(dep->version);
        }

        if (versions.size() > 1) {
            issues.push_back(make_issue(IssueKind::VersionConflict, Severity::Warning,
                "Multiple versions of " + name + ": " + text::join(versions, ", ")));
            conflicts.push_back(VersionConflict{name, versions});
        }

        for (const auto* dep : group) {
            std::string lower = text::to_lower(dep->version);
            if (text::contains(lower, "main") || text::contains(lower, "master") ||
                text::contains(lower, "develop")) {
                PackageIssue issue = make_issue(IssueKind::VersionConflict, Severity::Info,
                    "Using branch '" + dep->version + "' may cause instability");
                issue.target = dep->name;
                issues.push_back(std::move(issue));
            }
        }
    }
}

// Approximate on purpose: keyword scan plus a repeated-name scan over every
// raw line. Not a graph cycle check.
static bool looks_circular(const std::string& input,
                           const std::vector<std::string>& lines) {
    std::string lower = text::to_lower(input);
    if (text::contains(lower, "circular") || text::contains(lower, "cycle") ||
        text::contains(lower, "loop")) {
        return true;
    }

    std::unordered_set<std::string> seen;
    for (const auto& line : lines) {
        auto dep = parse_dependency_line(line);
        if (!dep) continue;
        if (!seen.insert(dep->name).second) {
            log::debug("show-dependencies: '%s' appears more than once", dep->name.c_str());
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// parse_show_dependencies
// ---------------------------------------------------------------------------

Result<PackageAnalysis> parse_show_dependencies(const std::string& input) {
    if (!text::is_valid_utf8(input)) {
        return SiftError{SiftError::Encoding,
            "show-dependencies output is not valid UTF-8"};
    }

    auto lines = text::split_lines(input);

    std::vector<ExternalDependency> parsed;
    std::vector<LocalDependency> local;
    std::vector<PackageIssue> issues;

    int line_number = 0;
    for (const auto& raw : lines) {
        ++line_number;
        TreeLine tl = classify_tree_line(raw, line_number);
        switch (tl.kind) {
            case TreeLineKind::Dependency:
                parsed.push_back(std::move(*tl.dependency));
                break;
            case TreeLineKind::LocalPath:
                local.push_back(std::move(*tl.local));
                break;
            case TreeLineKind::Diagnostic:
                issues.push_back(std::move(*tl.issue));
                break;
            case TreeLineKind::Blank:
            case TreeLineKind::Header:
            case TreeLineKind::Unrecognized:
                log::trace("show-dependencies: line %d skipped (%s)",
                           line_number, tree_line_kind_name(tl.kind));
                break;
        }
    }

    DependencyAnalysis deps;
    check_versions(parsed, issues, deps.version_conflicts);

    // Anything with a URL or a concrete version is external; "unspecified"
    // entries are bare names and count as local packages.
    for (auto& dep : parsed) {
        if (dep.url.has_value() || (!dep.version.empty() && dep.version != "unspecified")) {
            deps.external.push_back(std::move(dep));
        } else if (dep.version == "unspecified") {
            local.push_back(LocalDependency{dep.name, dep.name});
        }
    }
    deps.local = std::move(local);
    deps.count = static_cast<int>(deps.external.size() + deps.local.size());

    deps.circular_imports = looks_circular(input, lines);
    if (deps.circular_imports) {
        issues.push_back(make_issue(IssueKind::CircularImport, Severity::Error,
            "Circular dependency detected in package graph"));
    }

    log::debug("show-dependencies: %zu external, %zu local, %zu issues",
               deps.external.size(), deps.local.size(), issues.size());

    PackageAnalysis result;
    result.command = CommandKind::ShowDependencies;
    result.success = !has_blocking_issue(issues, kTreeBlockingSeverity);
    result.dependencies = std::move(deps);
    result.issues = std::move(issues);
    return Result<PackageAnalysis>::ok(std::move(result));
}

} // namespace spmsift

#pragma once

#include <spmsift/result.hpp>
#include <string>
#include <vector>
#include <optional>

namespace spmsift {

// ---------------------------------------------------------------------------
// Enumerations
// ---------------------------------------------------------------------------

// Which `swift package` sub-command produced the input
enum class CommandKind {
    DumpPackage,       // "dump-package"
    ShowDependencies,  // "show-dependencies"
    Resolve,           // "resolve"
    Describe,          // "describe"
    Update,            // "update"
    Unknown,           // "unknown"
};

enum class DependencyKind {
    SourceControl,     // "source-control"
    Binary,            // "binary"
    Registry,          // "registry"
};

enum class IssueKind {
    CircularImport,    // "circular_import"
    MissingTarget,     // "missing_target"
    VersionConflict,   // "version_conflict"
    PlatformMismatch,  // "platform_mismatch"
    SyntaxError,       // "syntax_error"
    DependencyError,   // "dependency_error"
    NetworkError,      // "network_error"
    Unknown,           // "unknown"
};

// Declaration order is the rank order: Info < Warning < Error < Critical
enum class Severity {
    Info,
    Warning,
    Error,
    Critical,
};

enum class Complexity {
    Low,
    Medium,
    High,
    Unknown,
};

const char* command_name(CommandKind k);
const char* dependency_kind_name(DependencyKind k);
const char* issue_kind_name(IssueKind k);
const char* severity_name(Severity s);
const char* complexity_name(Complexity c);

Result<CommandKind> parse_command_kind(const std::string& name);
Result<DependencyKind> parse_dependency_kind(const std::string& name);
Result<IssueKind> parse_issue_kind(const std::string& name);
Result<Severity> parse_severity(const std::string& name);
Result<Complexity> parse_complexity(const std::string& name);

inline int severity_rank(Severity s) {
    return static_cast<int>(s);
}

inline bool severity_at_least(Severity s, Severity minimum) {
    return severity_rank(s) >= severity_rank(minimum);
}

// ---------------------------------------------------------------------------
// Entities
// ---------------------------------------------------------------------------

struct ExternalDependency {
    std::string name;
    // Free-form: "1.2.3", "1.0.0 - 2.0.0", "branch: main", "revision: abc1234",
    // or "unspecified"
    std::string version;
    DependencyKind kind = DependencyKind::SourceControl;
    std::optional<std::string> url;

    bool operator==(const ExternalDependency& o) const;
};

struct LocalDependency {
    std::string name;
    std::string path;

    bool operator==(const LocalDependency& o) const;
};

struct VersionConflict {
    std::string dependency;
    std::vector<std::string> required_versions;

    bool operator==(const VersionConflict& o) const;
};

struct PackageIssue {
    IssueKind kind = IssueKind::Unknown;
    Severity severity = Severity::Info;
    std::optional<std::string> target;
    std::string message;
    std::optional<int> line;

    bool operator==(const PackageIssue& o) const;
};

// One target of a dump-package manifest
struct TargetDetail {
    std::string name;
    std::string type;                        // raw "type" string
    std::vector<std::string> platforms;      // settings[].condition.platformNames
    std::vector<std::string> dependencies;   // product / byName / plain names

    bool operator==(const TargetDetail& o) const;
};

struct TargetAnalysis {
    int count = 0;
    bool has_test_targets = false;
    std::vector<std::string> platforms;
    std::vector<std::string> executables;
    std::vector<std::string> libraries;
    std::optional<std::string> filtered_target;
    std::optional<std::vector<TargetDetail>> targets;

    bool operator==(const TargetAnalysis& o) const;
};

struct DependencyAnalysis {
    int count = 0;                           // external + local
    std::vector<ExternalDependency> external;
    std::vector<LocalDependency> local;
    bool circular_imports = false;
    std::vector<VersionConflict> version_conflicts;

    bool operator==(const DependencyAnalysis& o) const;
};

struct PackageMetrics {
    double parse_time = 0.0;                 // seconds
    Complexity complexity = Complexity::Unknown;
    std::optional<std::string> estimated_index_time;

    bool operator==(const PackageMetrics& o) const;
};

struct PackageAnalysis {
    CommandKind command = CommandKind::Unknown;
    bool success = false;
    std::optional<TargetAnalysis> targets;
    std::optional<DependencyAnalysis> dependencies;
    std::vector<PackageIssue> issues;        // detection order
    std::optional<PackageMetrics> metrics;
    std::optional<std::string> raw_output;

    bool operator==(const PackageAnalysis& o) const;
    bool operator!=(const PackageAnalysis& o) const;
};

// ---------------------------------------------------------------------------
// Success rules
// ---------------------------------------------------------------------------

// The two structural parsers decide success differently and the difference is
// observable: show-dependencies fails on any error, dump-package only on a
// critical issue.
inline constexpr Severity kTreeBlockingSeverity = Severity::Error;
inline constexpr Severity kManifestBlockingSeverity = Severity::Critical;

// True if any issue is at or above `threshold`
bool has_blocking_issue(const std::vector<PackageIssue>& issues, Severity threshold);

// Build an issue with no target or line
PackageIssue make_issue(IssueKind kind, Severity severity, std::string message);

} // namespace spmsift

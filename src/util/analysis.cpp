#include <spmsift/analysis.hpp>

namespace spmsift {

// ---------------------------------------------------------------------------
// Enum names
// ---------------------------------------------------------------------------

const char* command_name(CommandKind k) {
    switch (k) {
        case CommandKind::DumpPackage:      return "dump-package";
        case CommandKind::ShowDependencies: return "show-dependencies";
        case CommandKind::Resolve:          return "resolve";
        case CommandKind::Describe:         return "describe";
        case CommandKind::Update:           return "update";
        case CommandKind::Unknown:          return "unknown";
    }
    return "unknown";
}

const char* dependency_kind_name(DependencyKind k) {
    switch (k) {
        case DependencyKind::SourceControl: return "source-control";
        case DependencyKind::Binary:        return "binary";
        case DependencyKind::Registry:      return "registry";
    }
    return "source-control";
}

const char* issue_kind_name(IssueKind k) {
    switch (k) {
        case IssueKind::CircularImport:   return "circular_import";
        case IssueKind::MissingTarget:    return "missing_target";
        case IssueKind::VersionConflict:  return "version_conflict";
        case IssueKind::PlatformMismatch: return "platform_mismatch";
        case IssueKind::SyntaxError:      return "syntax_error";
        case IssueKind::DependencyError:  return "dependency_error";
        case IssueKind::NetworkError:     return "network_error";
        case IssueKind::Unknown:          return "unknown";
    }
    return "unknown";
}

const char* severity_name(Severity s) {
    switch (s) {
        case Severity::Info:     return "info";
        case Severity::Warning:  return "warning";
        case Severity::Error:    return "error";
        case Severity::Critical: return "critical";
    }
    return "info";
}

const char* complexity_name(Complexity c) {
    switch (c) {
        case Complexity::Low:     return "low";
        case Complexity::Medium:  return "medium";
        case Complexity::High:    return "high";
        case Complexity::Unknown: return "unknown";
    }
    return "unknown";
}

// Linear lookup over every enumerator through its name function
template<typename E, size_t N>
static Result<E> parse_enum(const std::string& name, const E (&all)[N],
                            const char* (*to_name)(E), const char* what) {
    std::string accepted;
    for (E e : all) {
        if (name == to_name(e)) return Result<E>::ok(e);
        if (!accepted.empty()) accepted += ", ";
        accepted += to_name(e);
    }
    return SiftError{SiftError::Parse,
        std::string("unknown ") + what + " '" + name + "'",
        "expected one of: " + accepted};
}

Result<CommandKind> parse_command_kind(const std::string& name) {
    static const CommandKind all[] = {
        CommandKind::DumpPackage, CommandKind::ShowDependencies,
        CommandKind::Resolve, CommandKind::Describe,
        CommandKind::Update, CommandKind::Unknown};
    return parse_enum(name, all, command_name, "command");
}

Result<DependencyKind> parse_dependency_kind(const std::string& name) {
    static const DependencyKind all[] = {
        DependencyKind::SourceControl, DependencyKind::Binary,
        DependencyKind::Registry};
    return parse_enum(name, all, dependency_kind_name, "dependency type");
}

Result<IssueKind> parse_issue_kind(const std::string& name) {
    static const IssueKind all[] = {
        IssueKind::CircularImport, IssueKind::MissingTarget,
        IssueKind::VersionConflict, IssueKind::PlatformMismatch,
        IssueKind::SyntaxError, IssueKind::DependencyError,
        IssueKind::NetworkError, IssueKind::Unknown};
    return parse_enum(name, all, issue_kind_name, "issue type");
}

Result<Severity> parse_severity(const std::string& name) {
    static const Severity all[] = {
        Severity::Info, Severity::Warning, Severity::Error, Severity::Critical};
    return parse_enum(name, all, severity_name, "severity");
}

Result<Complexity> parse_complexity(const std::string& name) {
    static const Complexity all[] = {
        Complexity::Low, Complexity::Medium, Complexity::High,
        Complexity::Unknown};
    return parse_enum(name, all, complexity_name, "complexity");
}

// ---------------------------------------------------------------------------
// Equality
// ---------------------------------------------------------------------------

bool ExternalDependency::operator==(const ExternalDependency& o) const {
    return name == o.name && version == o.version && kind == o.kind &&
           url == o.url;
}

bool LocalDependency::operator==(const LocalDependency& o) const {
    return name == o.name && path == o.path;
}

bool VersionConflict::operator==(const VersionConflict& o) const {
    return dependency == o.dependency && required_versions == o.required_versions;
}

bool PackageIssue::operator==(const PackageIssue& o) const {
    return kind == o.kind && severity == o.severity && target == o.target &&
           message == o.message && line == o.line;
}

bool TargetDetail::operator==(const TargetDetail& o) const {
    return name == o.name && type == o.type && platforms == o.platforms &&
           dependencies == o.dependencies;
}

bool TargetAnalysis::operator==(const TargetAnalysis& o) const {
    return count == o.count && has_test_targets == o.has_test_targets &&
           platforms == o.platforms && executables == o.executables &&
           libraries == o.libraries && filtered_target == o.filtered_target &&
           targets == o.targets;
}

bool DependencyAnalysis::operator==(const DependencyAnalysis& o) const {
    return count == o.count && external == o.external && local == o.local &&
           circular_imports == o.circular_imports &&
           version_conflicts == o.version_conflicts;
}

bool PackageMetrics::operator==(const PackageMetrics& o) const {
    return parse_time == o.parse_time && complexity == o.complexity &&
           estimated_index_time == o.estimated_index_time;
}

bool PackageAnalysis::operator==(const PackageAnalysis& o) const {
    return command == o.command && success == o.success &&
           targets == o.targets && dependencies == o.dependencies &&
           issues == o.issues && metrics == o.metrics &&
           raw_output == o.raw_output;
}

bool PackageAnalysis::operator!=(const PackageAnalysis& o) const {
    return !(*this == o);
}

// ---------------------------------------------------------------------------
// Aggregation
// ---------------------------------------------------------------------------

bool has_blocking_issue(const std::vector<PackageIssue>& issues, Severity threshold) {
    for (const auto& issue : issues) {
        if (severity_at_least(issue.severity, threshold)) return true;
    }
    return false;
}

PackageIssue make_issue(IssueKind kind, Severity severity, std::string message) {
    PackageIssue issue;
    issue.kind = kind;
    issue.severity = severity;
    issue.message = std::move(message);
    return issue;
}

} // namespace spmsift

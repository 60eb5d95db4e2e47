#include <spmsift/serialize.hpp>
#include <stdexcept>

namespace spmsift {

using nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

template<typename E>
static E enum_from(const json& j, const char* key,
                   Result<E> (*parse)(const std::string&)) {
    auto r = parse(j.at(key).get<std::string>());
    if (r.is_err()) throw std::invalid_argument(r.error().message);
    return r.value();
}

template<typename T>
static void put_optional(json& j, const char* key, const std::optional<T>& v) {
    if (v.has_value()) j[key] = *v;
}

template<typename T>
static void get_optional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->template get<T>();
    } else {
        out.reset();
    }
}

// ---------------------------------------------------------------------------
// to_json
// ---------------------------------------------------------------------------

void to_json(json& j, const ExternalDependency& d) {
    j = json{{"name", d.name},
             {"version", d.version},
             {"type", dependency_kind_name(d.kind)}};
    put_optional(j, "url", d.url);
}

void to_json(json& j, const LocalDependency& d) {
    j = json{{"name", d.name}, {"path", d.path}};
}

void to_json(json& j, const VersionConflict& c) {
    j = json{{"dependency", c.dependency},
             {"requiredVersions", c.required_versions}};
}

void to_json(json& j, const PackageIssue& i) {
    j = json{{"type", issue_kind_name(i.kind)},
             {"severity", severity_name(i.severity)},
             {"message", i.message}};
    put_optional(j, "target", i.target);
    put_optional(j, "line", i.line);
}

void to_json(json& j, const TargetDetail& t) {
    j = json{{"name", t.name},
             {"type", t.type},
             {"platforms", t.platforms},
             {"dependencies", t.dependencies}};
}

void to_json(json& j, const TargetAnalysis& t) {
    j = json{{"count", t.count},
             {"hasTestTargets", t.has_test_targets},
             {"platforms", t.platforms},
             {"executables", t.executables},
             {"libraries", t.libraries}};
    put_optional(j, "filteredTarget", t.filtered_target);
    put_optional(j, "targets", t.targets);
}

void to_json(json& j, const DependencyAnalysis& d) {
    j = json{{"count", d.count},
             {"external", d.external},
             {"local", d.local},
             {"circularImports", d.circular_imports},
             {"versionConflicts", d.version_conflicts}};
}

void to_json(json& j, const PackageMetrics& m) {
    j = json{{"parseTime", m.parse_time},
             {"complexity", complexity_name(m.complexity)}};
    put_optional(j, "estimatedIndexTime", m.estimated_index_time);
}

void to_json(json& j, const PackageAnalysis& a) {
    j = json{{"command", command_name(a.command)},
             {"success", a.success},
             {"issues", a.issues}};
    put_optional(j, "targets", a.targets);
    put_optional(j, "dependencies", a.dependencies);
    put_optional(j, "metrics", a.metrics);
    put_optional(j, "rawOutput", a.raw_output);
}

// ---------------------------------------------------------------------------
// from_json
// ---------------------------------------------------------------------------

void from_json(const json& j, ExternalDependency& d) {
    j.at("name").get_to(d.name);
    j.at("version").get_to(d.version);
    d.kind = enum_from<DependencyKind>(j, "type", parse_dependency_kind);
    get_optional(j, "url", d.url);
}

void from_json(const json& j, LocalDependency& d) {
    j.at("name").get_to(d.name);
    j.at("path").get_to(d.path);
}

void from_json(const json& j, VersionConflict& c) {
    j.at("dependency").get_to(c.dependency);
    j.at("requiredVersions").get_to(c.required_versions);
}

void from_json(const json& j, PackageIssue& i) {
    i.kind = enum_from<IssueKind>(j, "type", parse_issue_kind);
    i.severity = enum_from<Severity>(j, "severity", parse_severity);
    j.at("message").get_to(i.message);
    get_optional(j, "target", i.target);
    get_optional(j, "line", i.line);
}

void from_json(const json& j, TargetDetail& t) {
    j.at("name").get_to(t.name);
    j.at("type").get_to(t.type);
    j.at("platforms").get_to(t.platforms);
    j.at("dependencies").get_to(t.dependencies);
}

void from_json(const json& j, TargetAnalysis& t) {
    j.at("count").get_to(t.count);
    j.at("hasTestTargets").get_to(t.has_test_targets);
    j.at("platforms").get_to(t.platforms);
    j.at("executables").get_to(t.executables);
    j.at("libraries").get_to(t.libraries);
    get_optional(j, "filteredTarget", t.filtered_target);
    get_optional(j, "targets", t.targets);
}

void from_json(const json& j, DependencyAnalysis& d) {
    j.at("count").get_to(d.count);
    j.at("external").get_to(d.external);
    j.at("local").get_to(d.local);
    j.at("circularImports").get_to(d.circular_imports);
    j.at("versionConflicts").get_to(d.version_conflicts);
}

void from_json(const json& j, PackageMetrics& m) {
    j.at("parseTime").get_to(m.parse_time);
    m.complexity = enum_from<Complexity>(j, "complexity", parse_complexity);
    get_optional(j, "estimatedIndexTime", m.estimated_index_time);
}

void from_json(const json& j, PackageAnalysis& a) {
    a.command = enum_from<CommandKind>(j, "command", parse_command_kind);
    j.at("success").get_to(a.success);
    j.at("issues").get_to(a.issues);
    get_optional(j, "targets", a.targets);
    get_optional(j, "dependencies", a.dependencies);
    get_optional(j, "metrics", a.metrics);
    get_optional(j, "rawOutput", a.raw_output);
}

// ---------------------------------------------------------------------------
// String entry points
// ---------------------------------------------------------------------------

std::string to_json_string(const PackageAnalysis& a, int indent) {
    json j = a;
    // Raw echoes of the input may carry bytes that are not valid UTF-8
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

Result<PackageAnalysis> analysis_from_json(const std::string& json_text) {
    try {
        auto j = json::parse(json_text);
        return Result<PackageAnalysis>::ok(j.get<PackageAnalysis>());
    } catch (const json::exception& e) {
        return SiftError{SiftError::Parse,
            std::string("invalid analysis JSON: ") + e.what()};
    } catch (const std::invalid_argument& e) {
        return SiftError{SiftError::Parse,
            std::string("invalid analysis JSON: ") + e.what()};
    }
}

} // namespace spmsift

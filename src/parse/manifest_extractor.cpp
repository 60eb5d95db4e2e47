#include <spmsift/manifest_extractor.hpp>
#include <spmsift/log.hpp>
#include <spmsift/text.hpp>

#include <nlohmann/json.hpp>
#include <algorithm>
#include <unordered_set>

namespace spmsift {

using nlohmann::json;

namespace {

// ---------------------------------------------------------------------------
// JSON boundary helpers
// ---------------------------------------------------------------------------

bool has_member(const json& obj, const char* key) {
    return obj.is_object() && obj.contains(key);
}

const json* object_at(const json& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) return nullptr;
    return &*it;
}

const json* array_at(const json& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) return nullptr;
    return &*it;
}

std::optional<std::string> string_at(const json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<std::string> string_elem(const json& arr, size_t index) {
    if (!arr.is_array() || index >= arr.size() || !arr[index].is_string()) {
        return std::nullopt;
    }
    return arr[index].get<std::string>();
}

// The current schema spells Optional<T> as [] or [T]. Every read of such a
// field goes through here; the rest of the extractor sees plain pointers.
const json* unwrap_first_object(const json& obj, const char* key) {
    const json* arr = array_at(obj, key);
    if (!arr || arr->empty() || !(*arr)[0].is_object()) return nullptr;
    return &(*arr)[0];
}

// String elements of an array, or nullopt if any element is not a string
std::optional<std::vector<std::string>> string_array(const json& arr) {
    if (!arr.is_array()) return std::nullopt;
    std::vector<std::string> out;
    for (const auto& elem : arr) {
        if (!elem.is_string()) return std::nullopt;
        out.push_back(elem.get<std::string>());
    }
    return out;
}

std::string last_component(const std::string& s) {
    size_t slash = s.find_last_of('/');
    return slash == std::string::npos ? s : s.substr(slash + 1);
}

std::string name_from_url(const std::string& url) {
    std::string name = last_component(url);
    if (text::ends_with(name, ".git")) name.resize(name.size() - 4);
    return name;
}

// ---------------------------------------------------------------------------
// Normalised package dependency
// ---------------------------------------------------------------------------

enum class Schema { SourceControl, FileSystem, Legacy };

const char* schema_name(Schema s) {
    switch (s) {
        case Schema::SourceControl: return "sourceControl";
        case Schema::FileSystem:    return "fileSystem";
        case Schema::Legacy:        return "legacy";
    }
    return "legacy";
}

struct ManifestDependency {
    Schema schema = Schema::Legacy;
    std::string name;
    std::optional<std::string> url;
    std::optional<std::string> path;
    std::string version = "unspecified";
    bool missing_identity = false;
    size_t range_size = 0;
};

std::string legacy_version(const json& requirement) {
    if (const json* range = array_at(requirement, "range")) {
        auto parts = string_array(*range);
        if (parts && !parts->empty()) return text::join(*parts, ", ");
    }
    if (auto branch = string_at(requirement, "branch")) {
        return "branch: " + *branch;
    }
    if (auto revision = string_at(requirement, "revision")) {
        return "revision: " + revision->substr(0, 7);
    }
    if (auto exact = string_at(requirement, "exact")) {
        return *exact;
    }
    return "unspecified";
}

size_t range_size(const json* requirement) {
    if (!requirement) return 0;
    const json* range = array_at(*requirement, "range");
    return range ? range->size() : 0;
}

ManifestDependency read_dependency(const json& entry) {
    ManifestDependency dep;

    if (const json* sc = unwrap_first_object(entry, "sourceControl")) {
        dep.schema = Schema::SourceControl;
        if (auto identity = string_at(*sc, "identity")) {
            dep.name = *identity;
        } else {
            dep.missing_identity = true;
        }

        if (const json* location = object_at(*sc, "location")) {
            if (const json* remote = unwrap_first_object(*location, "remote")) {
                dep.url = string_at(*remote, "urlString");
            }
        }

        const json* requirement = object_at(*sc, "requirement");
        if (requirement) {
            if (const json* range = unwrap_first_object(*requirement, "range")) {
                auto lower = string_at(*range, "lowerBound");
                auto upper = string_at(*range, "upperBound");
                if (lower && upper) dep.version = *lower + " - " + *upper;
            }
        }
        dep.range_size = range_size(requirement);
    } else if (const json* fs = unwrap_first_object(entry, "fileSystem")) {
        dep.schema = Schema::FileSystem;
        dep.path = string_at(*fs, "path");
        if (auto identity = string_at(*fs, "identity")) {
            dep.name = *identity;
        } else {
            dep.missing_identity = true;
            if (dep.path) dep.name = last_component(*dep.path);
        }
        return dep;
    }

    if (!dep.name.empty()) return dep;

    // Legacy flat object. A sourceControl entry without an identity lands here
    // too and keeps nothing from its location.
    dep.version = "unspecified";
    dep.range_size = 0;
    dep.url = string_at(entry, "url");
    dep.path = string_at(entry, "path");
    if (auto name = string_at(entry, "name")) {
        dep.name = *name;
    } else if (dep.url) {
        dep.name = name_from_url(*dep.url);
    } else if (dep.path) {
        dep.name = last_component(*dep.path);
    }

    const json* requirement = object_at(entry, "requirement");
    if (requirement) dep.version = legacy_version(*requirement);
    dep.range_size = range_size(requirement);
    return dep;
}

DependencyKind classify_url(const std::string& url) {
    if (text::ends_with(url, ".binary")) return DependencyKind::Binary;
    if (text::contains(url, "@swift-package-registry")) return DependencyKind::Registry;
    return DependencyKind::SourceControl;
}

void validate_dependency(const ManifestDependency& dep,
                         std::vector<PackageIssue>& issues) {
    switch (dep.schema) {
        case Schema::SourceControl:
            if (dep.missing_identity) {
                issues.push_back(make_issue(IssueKind::DependencyError, Severity::Error,
                    "Source control dependency missing identity"));
            }
            break;
        case Schema::FileSystem:
            if (!dep.path) {
                issues.push_back(make_issue(IssueKind::DependencyError, Severity::Error,
                    "File system dependency missing path"));
            }
            break;
        case Schema::Legacy:
            if (!dep.url && !dep.path) {
                issues.push_back(make_issue(IssueKind::DependencyError, Severity::Error,
                    "Dependency has neither URL nor path"));
            }
            break;
    }

    if (dep.range_size > 2) {
        issues.push_back(make_issue(IssueKind::VersionConflict, Severity::Warning,
            "Complex version range may cause resolution issues"));
    }
}

// ---------------------------------------------------------------------------
// Targets
// ---------------------------------------------------------------------------

// A target's reference to a product. The package-level dependency list is
// keyed by package identity, the target's list by product name, so both are
// kept for cross-referencing.
struct ProductRef {
    std::string product;
    std::optional<std::string> package;
};

std::vector<ProductRef> target_product_refs(const json& target) {
    std::vector<ProductRef> refs;
    const json* deps = array_at(target, "dependencies");
    if (!deps) return refs;

    for (const auto& entry : *deps) {
        if (entry.is_string()) {
            refs.push_back(ProductRef{entry.get<std::string>(), std::nullopt});
        } else if (const json* product = array_at(entry, "product")) {
            if (auto name = string_elem(*product, 0)) {
                refs.push_back(ProductRef{*name, string_elem(*product, 1)});
            }
        } else if (const json* by_name = array_at(entry, "byName")) {
            if (auto name = string_elem(*by_name, 0)) {
                refs.push_back(ProductRef{*name, *name});
            }
        }
    }
    return refs;
}

std::vector<std::string> target_platforms(const json& target) {
    std::vector<std::string> platforms;
    const json* settings = array_at(target, "settings");
    if (!settings) return platforms;

    for (const auto& setting : *settings) {
        const json* condition = object_at(setting, "condition");
        if (!condition) continue;
        const json* names = array_at(*condition, "platformNames");
        if (!names) continue;
        for (const auto& n : *names) {
            if (n.is_string()) platforms.push_back(n.get<std::string>());
        }
    }
    return platforms;
}

// Package-level "platforms": {"iOS": "15.0"} or [{"platformName", "version"}]
std::vector<std::string> package_platforms(const json& doc) {
    std::vector<std::string> out;
    auto it = doc.find("platforms");
    if (it == doc.end()) return out;

    if (it->is_object()) {
        for (const auto& item : it->items()) {
            if (item.value().is_string()) {
                out.push_back(item.key() + " " + item.value().get<std::string>());
            }
        }
    } else if (it->is_array()) {
        for (const auto& entry : *it) {
            auto platform = string_at(entry, "platformName");
            auto version = string_at(entry, "version");
            if (platform && version) out.push_back(*platform + " " + *version);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

const json* find_target(const json& doc, const std::string& name) {
    const json* targets = array_at(doc, "targets");
    if (!targets) return nullptr;
    for (const auto& t : *targets) {
        if (string_at(t, "name") == name) return &t;
    }
    return nullptr;
}

TargetAnalysis extract_targets(const json& doc,
                               const std::optional<std::string>& filter,
                               std::vector<PackageIssue>& issues) {
    TargetAnalysis analysis;
    const json* targets = array_at(doc, "targets");
    if (!targets) {
        issues.push_back(make_issue(IssueKind::MissingTarget, Severity::Warning,
            "No targets found in package"));
        analysis.platforms = package_platforms(doc);
        return analysis;
    }

    std::vector<TargetDetail> details;
    std::vector<PackageIssue> target_issues;
    for (const auto& t : *targets) {
        auto name = string_at(t, "name");
        if (!name) continue;
        if (filter && *name != *filter) continue;

        ++analysis.count;

        TargetDetail detail;
        detail.name = *name;
        detail.type = string_at(t, "type").value_or("unknown");
        detail.platforms = target_platforms(t);
        for (const auto& ref : target_product_refs(t)) {
            detail.dependencies.push_back(ref.product);
        }

        std::string type = text::to_lower(detail.type);
        if (type == "executable") {
            analysis.executables.push_back(*name);
        } else if (type == "library" || type == "static-library" ||
                   type == "dynamic-library") {
            analysis.libraries.push_back(*name);
        } else if (type == "test") {
            analysis.has_test_targets = true;
        }

        const json* target_deps = array_at(t, "dependencies");
        if (target_deps && target_deps->empty() && !text::contains_ci(*name, "test")) {
            PackageIssue issue = make_issue(IssueKind::MissingTarget, Severity::Info,
                "Target '" + *name + "' has no dependencies");
            issue.target = *name;
            target_issues.push_back(std::move(issue));
        }

        details.push_back(std::move(detail));
    }

    // A filter that matches nothing is not worth an issue
    if (filter && details.empty()) {
        TargetAnalysis empty;
        empty.filtered_target = filter;
        empty.targets = std::vector<TargetDetail>{};
        return empty;
    }

    analysis.platforms = package_platforms(doc);
    analysis.filtered_target = filter;
    if (!details.empty()) analysis.targets = std::move(details);
    issues.insert(issues.end(), target_issues.begin(), target_issues.end());
    return analysis;
}

// ---------------------------------------------------------------------------
// Package dependencies
// ---------------------------------------------------------------------------

DependencyAnalysis extract_dependencies(const json& doc,
                                        const std::optional<std::string>& filter,
                                        std::vector<PackageIssue>& issues) {
    DependencyAnalysis analysis;

    std::unordered_set<std::string> referenced;
    if (filter) {
        const json* target = find_target(doc, *filter);
        if (!target || !has_member(*target, "dependencies")) return analysis;
        for (const auto& ref : target_product_refs(*target)) {
            referenced.insert(ref.product);
            if (ref.package) referenced.insert(*ref.package);
        }
    }

    const json* entries = array_at(doc, "dependencies");
    if (!entries) return analysis;

    for (const auto& entry : *entries) {
        ManifestDependency dep = read_dependency(entry);
        validate_dependency(dep, issues);

        if (dep.name.empty()) continue;
        if (filter && referenced.count(dep.name) == 0) {
            log::trace("dump-package: '%s' not used by target '%s'",
                       dep.name.c_str(), filter->c_str());
            continue;
        }

        log::debug("dump-package: dependency '%s' (%s schema)",
                   dep.name.c_str(), schema_name(dep.schema));

        if (dep.url) {
            ExternalDependency ext;
            ext.name = dep.name;
            ext.version = dep.version;
            ext.kind = classify_url(*dep.url);
            ext.url = dep.url;
            analysis.external.push_back(std::move(ext));
        } else if (dep.path) {
            analysis.local.push_back(LocalDependency{dep.name, *dep.path});
        }
    }

    analysis.count = static_cast<int>(analysis.external.size() + analysis.local.size());

    // Size proxy only: large graphs are where cycles tend to show up
    analysis.circular_imports = analysis.count > 20;
    if (analysis.circular_imports) {
        issues.push_back(make_issue(IssueKind::CircularImport, Severity::Error,
            "Potential circular dependencies detected"));
    }
    return analysis;
}

void validate_package(const json& doc, std::vector<PackageIssue>& issues) {
    if (!has_member(doc, "name")) {
        issues.push_back(make_issue(IssueKind::SyntaxError, Severity::Critical,
            "Package missing required 'name' field"));
    }
    if (!has_member(doc, "products")) {
        issues.push_back(make_issue(IssueKind::MissingTarget, Severity::Warning,
            "Package defines no products"));
    }
}

} // namespace

// ---------------------------------------------------------------------------
// parse_dump_package
// ---------------------------------------------------------------------------

Result<PackageAnalysis> parse_dump_package(const std::string& input,
                                           const std::optional<std::string>& target_filter) {
    if (!text::is_valid_utf8(input)) {
        return SiftError{SiftError::Encoding,
            "dump-package output is not valid UTF-8"};
    }

    PackageAnalysis result;
    result.command = CommandKind::DumpPackage;

    json doc;
    try {
        doc = json::parse(input);
    } catch (const json::exception& e) {
        // parse_error for bad syntax, out_of_range for numbers like 1e400
        log::debug("dump-package: %s", e.what());
        result.success = false;
        result.issues.push_back(make_issue(IssueKind::SyntaxError, Severity::Error,
            std::string("Failed to parse Package.swift JSON: ") + e.what()));
        return Result<PackageAnalysis>::ok(std::move(result));
    }

    if (!doc.is_object()) {
        return SiftError{SiftError::Parse,
            std::string("dump-package root is a JSON ") + doc.type_name() +
            ", expected an object"};
    }

    std::vector<PackageIssue> issues;
    TargetAnalysis targets = extract_targets(doc, target_filter, issues);
    DependencyAnalysis deps = extract_dependencies(doc, target_filter, issues);
    validate_package(doc, issues);

    if (target_filter) {
        issues.erase(std::remove_if(issues.begin(), issues.end(),
                         [&](const PackageIssue& i) {
                             return i.target.has_value() && *i.target != *target_filter;
                         }),
                     issues.end());
    }

    result.success = !has_blocking_issue(issues, kManifestBlockingSeverity);
    result.targets = std::move(targets);
    result.dependencies = std::move(deps);
    result.issues = std::move(issues);
    return Result<PackageAnalysis>::ok(std::move(result));
}

} // namespace spmsift

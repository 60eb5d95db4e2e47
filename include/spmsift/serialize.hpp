#pragma once

#include <spmsift/analysis.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace spmsift {

// nlohmann::json ADL hooks. Field names follow the spmsift JSON output
// (camelCase); absent optionals are omitted rather than written as null.
// from_json throws nlohmann::json::exception on shape errors and
// std::invalid_argument on unknown enum strings.
void to_json(nlohmann::json& j, const ExternalDependency& d);
void to_json(nlohmann::json& j, const LocalDependency& d);
void to_json(nlohmann::json& j, const VersionConflict& c);
void to_json(nlohmann::json& j, const PackageIssue& i);
void to_json(nlohmann::json& j, const TargetDetail& t);
void to_json(nlohmann::json& j, const TargetAnalysis& t);
void to_json(nlohmann::json& j, const DependencyAnalysis& d);
void to_json(nlohmann::json& j, const PackageMetrics& m);
void to_json(nlohmann::json& j, const PackageAnalysis& a);

void from_json(const nlohmann::json& j, ExternalDependency& d);
void from_json(const nlohmann::json& j, LocalDependency& d);
void from_json(const nlohmann::json& j, VersionConflict& c);
void from_json(const nlohmann::json& j, PackageIssue& i);
void from_json(const nlohmann::json& j, TargetDetail& t);
void from_json(const nlohmann::json& j, TargetAnalysis& t);
void from_json(const nlohmann::json& j, DependencyAnalysis& d);
void from_json(const nlohmann::json& j, PackageMetrics& m);
void from_json(const nlohmann::json& j, PackageAnalysis& a);

// Pretty-printed with `indent` spaces; indent < 0 gives compact output
std::string to_json_string(const PackageAnalysis& a, int indent = 2);

// Inverse of to_json_string
Result<PackageAnalysis> analysis_from_json(const std::string& json_text);

} // namespace spmsift

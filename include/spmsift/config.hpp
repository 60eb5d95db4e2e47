#pragma once

#include <spmsift/result.hpp>
#include <spmsift/analysis.hpp>
#include <spmsift/log.hpp>
#include <spmsift/report.hpp>
#include <string>
#include <optional>

namespace spmsift {

// [output] section
struct OutputConfig {
    OutputFormat format = OutputFormat::Json;
    Severity severity = Severity::Info;   // minimum issue severity kept
    bool verbose = false;                 // echo raw input as rawOutput
    bool metrics = false;                 // attach PackageMetrics
};

// [log] section
struct LogConfig {
    log::Level level = log::Warn;
    bool color = true;
};

// Layered configuration: global > project > explicit file > command line.
// Lower layers override higher ones, but only for fields they set.
struct Config {
    OutputConfig output;
    LogConfig logging;
    std::optional<std::string> target;    // [dump-package] target

    // Track which fields were explicitly set (for merge)
    bool format_set = false;
    bool severity_set = false;
    bool verbose_set = false;
    bool metrics_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string. `origin` names the source in error messages.
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& origin = "");

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    // Build effective config from layers, skipping absent ones
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& explicit_file);
};

// ~/.spmsift/config.toml, or "" when no home directory is known
std::string global_config_path();

// .spmsift.toml in the current directory
std::string project_config_path();

} // namespace spmsift

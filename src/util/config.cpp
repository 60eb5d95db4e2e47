#include <spmsift/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace spmsift {

static SiftError config_error(const std::string& origin, const std::string& msg,
                              const std::string& hint = "") {
    return SiftError{SiftError::Config, msg, hint, origin, 0};
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SiftError{SiftError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", origin, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [output] section
    if (auto output = doc["output"].as_table()) {
        if (auto v = (*output)["format"].value<std::string>()) {
            auto fmt = parse_output_format(*v);
            if (fmt.is_err()) {
                return config_error(origin, "output.format: " + fmt.error().message,
                                    fmt.error().hint);
            }
            cfg.output.format = fmt.value();
            cfg.format_set = true;
        }
        if (auto v = (*output)["severity"].value<std::string>()) {
            auto sev = parse_severity(*v);
            if (sev.is_err()) {
                return config_error(origin, "output.severity: " + sev.error().message,
                                    sev.error().hint);
            }
            cfg.output.severity = sev.value();
            cfg.severity_set = true;
        }
        if (auto v = (*output)["verbose"].value<bool>()) {
            cfg.output.verbose = *v;
            cfg.verbose_set = true;
        }
        if (auto v = (*output)["metrics"].value<bool>()) {
            cfg.output.metrics = *v;
            cfg.metrics_set = true;
        }
    }

    // [log] section
    if (auto logt = doc["log"].as_table()) {
        if (auto v = (*logt)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) {
                return config_error(origin, "log.level: " + lvl.error().message,
                                    lvl.error().hint);
            }
            cfg.logging.level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*logt)["color"].value<bool>()) {
            cfg.logging.color = *v;
            cfg.log_color_set = true;
        }
    }

    // [dump-package] section
    if (auto dump = doc["dump-package"].as_table()) {
        if (auto v = (*dump)["target"].value<std::string>()) {
            cfg.target = std::string(*v);
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SiftError{SiftError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    if (other.format_set) {
        output.format = other.output.format;
        format_set = true;
    }
    if (other.severity_set) {
        output.severity = other.output.severity;
        severity_set = true;
    }
    if (other.verbose_set) {
        output.verbose = other.output.verbose;
        verbose_set = true;
    }
    if (other.metrics_set) {
        output.metrics = other.output.metrics;
        metrics_set = true;
    }
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
    if (other.target.has_value()) {
        target = other.target;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& explicit_file) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (explicit_file.has_value()) result.merge(explicit_file.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.spmsift/config.toml";
}

std::string project_config_path() {
    return ".spmsift.toml";
}

} // namespace spmsift

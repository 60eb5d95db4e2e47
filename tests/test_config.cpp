#include <catch2/catch.hpp>
#include <spmsift/config.hpp>
#include <cstdio>
#include <fstream>

using namespace spmsift;

// ===== Parsing =====

TEST_CASE("parse config with output section", "[config]") {
    auto r = Config::parse(R"(
[output]
format = "summary"
severity = "warning"
verbose = true
metrics = true
)");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.output.format == OutputFormat::Summary);
    REQUIRE(cfg.output.severity == Severity::Warning);
    REQUIRE(cfg.output.verbose == true);
    REQUIRE(cfg.output.metrics == true);
    REQUIRE(cfg.format_set);
    REQUIRE(cfg.severity_set);
}

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().logging.level == log::Debug);
    REQUIRE(r.value().logging.color == false);
    REQUIRE(r.value().log_level_set);
}

TEST_CASE("parse config with dump-package target", "[config]") {
    auto r = Config::parse(R"(
[dump-package]
target = "MyCore"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().target == std::optional<std::string>("MyCore"));
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.output.format == OutputFormat::Json);
    REQUIRE(cfg.output.severity == Severity::Info);
    REQUIRE_FALSE(cfg.output.verbose);
    REQUIRE_FALSE(cfg.output.metrics);
    REQUIRE(cfg.logging.level == log::Warn);
    REQUIRE_FALSE(cfg.target.has_value());
    REQUIRE_FALSE(cfg.format_set);
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml", "broken.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SiftError::Parse);
    REQUIRE(r.error().file == "broken.toml");
    REQUIRE(r.error().line == 1);
}

TEST_CASE("parse config with unknown enum values", "[config]") {
    auto fmt = Config::parse("[output]\nformat = \"yaml\"\n", "a.toml");
    REQUIRE(fmt.is_err());
    REQUIRE(fmt.error().code == SiftError::Config);
    REQUIRE(fmt.error().message.find("output.format") != std::string::npos);
    REQUIRE(fmt.error().file == "a.toml");

    auto sev = Config::parse("[output]\nseverity = \"fatal\"\n");
    REQUIRE(sev.is_err());
    REQUIRE(sev.error().code == SiftError::Config);

    auto lvl = Config::parse("[log]\nlevel = \"loud\"\n");
    REQUIRE(lvl.is_err());
    REQUIRE(lvl.error().code == SiftError::Config);
    REQUIRE(lvl.error().hint.find("trace") != std::string::npos);
}

TEST_CASE("load missing config file", "[config]") {
    auto r = Config::load("/nonexistent/spmsift/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SiftError::IO);
}

TEST_CASE("load config file from disk", "[config]") {
    std::string path = "spmsift_test_config.toml";
    {
        std::ofstream f(path);
        f << "[output]\nformat = \"detailed\"\n";
    }
    auto r = Config::load(path);
    std::remove(path.c_str());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().output.format == OutputFormat::Detailed);
}

// ===== Merge =====

TEST_CASE("merge overrides only fields that were set", "[config]") {
    auto base = Config::parse(R"(
[output]
format = "summary"
severity = "warning"

[dump-package]
target = "App"
)").value();

    auto overlay = Config::parse(R"(
[output]
severity = "error"
)").value();

    base.merge(overlay);
    REQUIRE(base.output.severity == Severity::Error);         // overridden
    REQUIRE(base.output.format == OutputFormat::Summary);     // preserved
    REQUIRE(base.target == std::optional<std::string>("App")); // preserved
}

TEST_CASE("merge can turn a flag back off", "[config]") {
    auto base = Config::parse("[output]\nverbose = true\n").value();
    auto overlay = Config::parse("[output]\nverbose = false\n").value();
    base.merge(overlay);
    REQUIRE_FALSE(base.output.verbose);
}

// ===== Effective config =====

TEST_CASE("effective config layering", "[config]") {
    auto global = Config::parse(R"(
[output]
format = "summary"
severity = "warning"

[log]
level = "info"
)").value();

    auto project = Config::parse(R"(
[output]
severity = "error"
metrics = true
)").value();

    auto explicit_file = Config::parse(R"(
[log]
level = "trace"
)").value();

    auto eff = Config::effective(global, project, explicit_file);

    // format: global only -> summary
    REQUIRE(eff.output.format == OutputFormat::Summary);
    // severity: global=warning, project=error -> error
    REQUIRE(eff.output.severity == Severity::Error);
    REQUIRE(eff.output.metrics == true);
    // level: global=info, explicit=trace -> trace
    REQUIRE(eff.logging.level == log::Trace);
}

TEST_CASE("effective with no layers", "[config]") {
    auto eff = Config::effective({}, {}, {});
    REQUIRE(eff.output.format == OutputFormat::Json);
    REQUIRE(eff.output.severity == Severity::Info);
    REQUIRE(eff.logging.level == log::Warn);
}

TEST_CASE("project config path", "[config]") {
    REQUIRE(project_config_path() == ".spmsift.toml");
    auto global = global_config_path();
    if (!global.empty()) {
        REQUIRE(global.find(".spmsift/config.toml") != std::string::npos);
    }
}

// spmsift: condense `swift package` output into structured JSON.
//
//     swift package dump-package | spmsift
//     swift package show-dependencies | spmsift --format summary
//     swift package resolve | spmsift --severity warning --metrics
//
// The result goes to stdout; logging and tool errors go to stderr. Exit
// status is 0 whenever an analysis was printed, even a failed one.

#include <spmsift/analyze.hpp>
#include <spmsift/config.hpp>
#include <spmsift/log.hpp>
#include <spmsift/report.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;
using namespace spmsift;

static const char* kVersion = "1.0.0";

static const char* kUsage =
    "usage: swift package <command> | spmsift [options]\n"
    "\n"
    "options:\n"
    "  -f, --format <fmt>       json | summary | detailed (default: json)\n"
    "      --severity <level>   minimum issue severity: info | warning | error | critical\n"
    "  -v, --verbose            include the raw input as rawOutput\n"
    "      --metrics            attach parse metrics\n"
    "  -t, --target <name>      restrict dump-package analysis to one target\n"
    "      --command <kind>     skip detection: dump-package | show-dependencies |\n"
    "                           resolve | describe | update\n"
    "  -c, --config <path>      read this TOML config after the default ones\n"
    "      --log-level <level>  trace | debug | info | warn | error\n"
    "      --version            print version and exit\n"
    "  -h, --help               print this help and exit\n";

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

struct CliArgs {
    Config overrides;                       // command-line layer
    std::optional<std::string> config_path;
    std::optional<CommandKind> command;
    bool help = false;
    bool version = false;
};

static Result<std::string> take_value(int argc, char** argv, int& i) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
        return SiftError{SiftError::Usage,
            "option '" + flag + "' requires a value", "see spmsift --help"};
    }
    return Result<std::string>::ok(argv[++i]);
}

static Result<CliArgs> parse_args(int argc, char** argv) {
    CliArgs args;
    Config& o = args.overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "--version") {
            args.version = true;
        } else if (arg == "-v" || arg == "--verbose") {
            o.output.verbose = true;
            o.verbose_set = true;
        } else if (arg == "--metrics") {
            o.output.metrics = true;
            o.metrics_set = true;
        } else if (arg == "-f" || arg == "--format") {
            auto v = take_value(argc, argv, i);
            SPMSIFT_TRY(v);
            auto fmt = parse_output_format(v.value());
            SPMSIFT_TRY(fmt);
            o.output.format = fmt.value();
            o.format_set = true;
        } else if (arg == "--severity") {
            auto v = take_value(argc, argv, i);
            SPMSIFT_TRY(v);
            auto sev = parse_severity(v.value());
            SPMSIFT_TRY(sev);
            o.output.severity = sev.value();
            o.severity_set = true;
        } else if (arg == "-t" || arg == "--target") {
            auto v = take_value(argc, argv, i);
            SPMSIFT_TRY(v);
            o.target = v.value();
        } else if (arg == "--command") {
            auto v = take_value(argc, argv, i);
            SPMSIFT_TRY(v);
            auto kind = parse_command_kind(v.value());
            SPMSIFT_TRY(kind);
            args.command = kind.value();
        } else if (arg == "-c" || arg == "--config") {
            auto v = take_value(argc, argv, i);
            SPMSIFT_TRY(v);
            args.config_path = v.value();
        } else if (arg == "--log-level") {
            auto v = take_value(argc, argv, i);
            SPMSIFT_TRY(v);
            auto lvl = log::parse_level(v.value());
            SPMSIFT_TRY(lvl);
            o.logging.level = lvl.value();
            o.log_level_set = true;
        } else {
            return SiftError{SiftError::Usage,
                "unknown option '" + arg + "'", "see spmsift --help"};
        }
    }

    return Result<CliArgs>::ok(std::move(args));
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

// Implicit layers are optional: a missing file is skipped silently, a broken
// one is skipped with a warning. Only --config is fatal.
static std::optional<Config> load_optional(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) return std::nullopt;

    auto cfg = Config::load(path);
    if (cfg.is_err()) {
        log::warn("ignoring config: %s", cfg.error().format().c_str());
        return std::nullopt;
    }
    log::debug("loaded config %s", path.c_str());
    return std::move(cfg).value();
}

static Result<Config> resolve_config(const CliArgs& args) {
    auto global = load_optional(global_config_path());
    auto project = load_optional(project_config_path());

    std::optional<Config> explicit_file;
    if (args.config_path.has_value()) {
        auto cfg = Config::load(*args.config_path);
        SPMSIFT_TRY(cfg);
        explicit_file = std::move(cfg).value();
    }

    Config cfg = Config::effective(global, project, explicit_file);
    cfg.merge(args.overrides);
    return Result<Config>::ok(std::move(cfg));
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        log::error("%s", args.error().format().c_str());
        return 1;
    }
    if (args.value().help) {
        std::cout << kUsage;
        return 0;
    }
    if (args.value().version) {
        std::cout << "spmsift " << kVersion << "\n";
        return 0;
    }

    auto cfg = resolve_config(args.value());
    if (cfg.is_err()) {
        log::error("%s", cfg.error().format().c_str());
        return 1;
    }
    const Config& config = cfg.value();
    log::set_level(config.logging.level);
    if (!config.logging.color) log::set_color_enabled(false);

    if (isatty(fileno(stdin))) {
        std::cout << "spmsift: No input detected. Pipe Swift Package Manager output to spmsift.\n";
        std::cout << "Usage: swift package <command> | spmsift\n";
        return 1;
    }

    std::string input((std::istreambuf_iterator<char>(std::cin)),
                      std::istreambuf_iterator<char>());
    if (std::cin.bad()) {
        log::error("failed to read standard input");
        return 1;
    }
    if (input.empty()) {
        std::cout << "{\"error\": \"No input received\"}\n";
        return 1;
    }

    AnalyzeOptions options;
    options.command = args.value().command;
    options.target = config.target;

    auto start = std::chrono::steady_clock::now();
    PackageAnalysis result = analyze(input, options);
    auto end = std::chrono::steady_clock::now();

    if (config.output.metrics) {
        double seconds = std::chrono::duration<double>(end - start).count();
        result.metrics = compute_metrics(result, seconds);
    }

    result.issues = filter_issues(result.issues, config.output.severity);

    if (config.output.verbose) {
        result.raw_output = input;
    }

    std::cout << render(result, config.output.format) << "\n";
    return 0;
}

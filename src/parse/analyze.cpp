#include <spmsift/analyze.hpp>
#include <spmsift/command_detector.hpp>
#include <spmsift/line_scanners.hpp>
#include <spmsift/log.hpp>
#include <spmsift/manifest_extractor.hpp>
#include <spmsift/tree_parser.hpp>

namespace spmsift {

static PackageAnalysis error_only(CommandKind command, const std::string& input) {
    PackageAnalysis result;
    result.command = command;
    result.success = false;
    for (auto& msg : extract_error_messages(input)) {
        result.issues.push_back(make_issue(IssueKind::Unknown, Severity::Error, std::move(msg)));
    }
    return result;
}

static PackageAnalysis from_failure(CommandKind command, const SiftError& err) {
    log::debug("%s", err.format().c_str());
    PackageAnalysis result;
    result.command = command;
    result.success = false;
    result.issues.push_back(make_issue(IssueKind::SyntaxError, Severity::Error, err.message));
    return result;
}

PackageAnalysis analyze(const std::string& input, const AnalyzeOptions& options) {
    CommandKind command = options.command.value_or(detect_command(input));
    log::debug("analyzing %s output (%zu bytes)", command_name(command), input.size());

    if (has_error_output(input)) {
        return error_only(command, input);
    }

    switch (command) {
        case CommandKind::DumpPackage: {
            auto r = parse_dump_package(input, options.target);
            if (r.is_err()) return from_failure(command, r.error());
            return std::move(r).value();
        }
        case CommandKind::ShowDependencies: {
            auto r = parse_show_dependencies(input);
            if (r.is_err()) return from_failure(command, r.error());
            return std::move(r).value();
        }
        case CommandKind::Resolve:
            return scan_resolve(input);
        case CommandKind::Describe:
            return scan_describe(input);
        case CommandKind::Update:
            return scan_update(input);
        case CommandKind::Unknown:
            break;
    }

    PackageAnalysis result;
    result.command = CommandKind::Unknown;
    result.success = false;
    result.issues.push_back(make_issue(IssueKind::Unknown, Severity::Warning,
        "Unknown command output format"));
    return result;
}

} // namespace spmsift

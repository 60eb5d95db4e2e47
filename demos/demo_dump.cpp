#include <spmsift/dependency_line.hpp>
#include <spmsift/tree_parser.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace spmsift;

static void print_dependency(const ExternalDependency& dep) {
    std::cout << dep.name << "  version=\"" << dep.version << "\"  "
              << dependency_kind_name(dep.kind);
    if (dep.url) std::cout << "  url=" << *dep.url;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: spmsift-dump <show-dependencies.txt> [--summary]\n";
        return 1;
    }

    std::string path = argv[1];
    bool show_summary = (argc > 2 && std::string(argv[2]) == "--summary");

    std::ifstream f(path);
    if (!f) {
        std::cerr << "error: cannot open " << path << "\n";
        return 1;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    std::string source = ss.str();

    // Per-line classification
    std::cout << "--- " << path << " ---\n";
    std::istringstream lines(source);
    std::string raw;
    int line_number = 0;
    while (std::getline(lines, raw)) {
        ++line_number;
        TreeLine tl = classify_tree_line(raw, line_number);
        std::cout << "  " << line_number << "  [" << tree_line_kind_name(tl.kind) << "]  ";
        switch (tl.kind) {
        case TreeLineKind::Dependency:
            print_dependency(*tl.dependency);
            break;
        case TreeLineKind::LocalPath:
            std::cout << "path=" << tl.local->path;
            break;
        case TreeLineKind::Diagnostic:
            std::cout << severity_name(tl.issue->severity) << ": " << tl.text;
            break;
        default:
            std::cout << tl.text;
            break;
        }
        std::cout << "\n";
    }

    if (!show_summary) return 0;

    // Whole-input analysis
    auto r = parse_show_dependencies(source);
    if (r.is_err()) {
        std::cerr << r.error().format() << "\n";
        return 1;
    }

    auto& result = r.value();
    const auto& deps = *result.dependencies;
    std::cout << "\n-- Summary --\n";
    std::cout << "  success: " << (result.success ? "yes" : "no") << "\n";
    std::cout << "  external: " << deps.external.size()
              << "  local: " << deps.local.size()
              << "  circular: " << (deps.circular_imports ? "yes" : "no") << "\n";

    for (const auto& c : deps.version_conflicts) {
        std::cout << "  conflict " << c.dependency << ":";
        for (const auto& v : c.required_versions) std::cout << " " << v;
        std::cout << "\n";
    }

    if (!result.issues.empty()) {
        std::cout << "\n-- Issues --\n";
        for (const auto& issue : result.issues) {
            std::cout << "  " << severity_name(issue.severity) << " "
                      << issue_kind_name(issue.kind) << ": " << issue.message;
            if (issue.line) std::cout << "  (line " << *issue.line << ")";
            std::cout << "\n";
        }
    }

    return 0;
}

#include <spmsift/dependency_line.hpp>
#include <spmsift/text.hpp>
#include <utility>

namespace spmsift {

static const char* const kUnspecified = "unspecified";

// Matches `<space><open>PAYLOAD<close>` at the end of `s`, where PAYLOAD is
// non-empty and contains no `close`. Returns the offset of the space.
static std::optional<size_t> match_suffix_group(const std::string& s,
                                                char open, char close) {
    if (s.size() < 4 || s.back() != close) return std::nullopt;

    size_t last = s.size() - 1;
    size_t prev_close = s.rfind(close, last - 1);
    size_t lo = (prev_close == std::string::npos) ? 0 : prev_close + 1;

    const char opener[] = {' ', open, '\0'};
    size_t at = s.find(opener, lo);
    if (at == std::string::npos || at + 2 >= last) return std::nullopt;
    return at;
}

// First `<...>` span with a non-empty body: {offset of '<', offset of '>'}
static std::optional<std::pair<size_t, size_t>> match_angle_span(const std::string& s) {
    size_t lt = s.find('<');
    while (lt != std::string::npos) {
        size_t gt = s.find('>', lt + 1);
        if (gt == std::string::npos) return std::nullopt;
        // Body is [^>]+, so the nearest '>' decides; a '<' inside the body is fine
        if (gt > lt + 1) return std::make_pair(lt, gt);
        lt = s.find('<', gt + 1);
    }
    return std::nullopt;
}

static std::optional<ExternalDependency> make_dep(std::string name,
                                                  std::string version,
                                                  DependencyKind kind,
                                                  std::optional<std::string> url) {
    name = text::trim(name);
    if (name.empty()) return std::nullopt;

    ExternalDependency dep;
    dep.name = std::move(name);
    dep.version = std::move(version);
    dep.kind = kind;
    dep.url = std::move(url);
    return dep;
}

DependencyKind classify_version(const std::string& version) {
    bool leading_major = version.size() >= 2 && version[1] == '.' &&
                         (version[0] == '1' || version[0] == '2' || version[0] == '3');
    if (text::contains(version, "registry") || leading_major) {
        return DependencyKind::Registry;
    }
    if (text::contains(version, ".binary") ||
        text::contains_ci(version, "xcframework")) {
        return DependencyKind::Binary;
    }
    return DependencyKind::SourceControl;
}

std::optional<ExternalDependency> parse_dependency_line(const std::string& line) {
    std::string rest = text::trim(text::strip_tree_prefix(line));
    if (rest.empty()) return std::nullopt;

    // name (version)
    if (auto at = match_suffix_group(rest, '(', ')')) {
        std::string version = rest.substr(*at + 2, rest.size() - *at - 3);
        auto kind = classify_version(version);
        return make_dep(rest.substr(0, *at), std::move(version), kind, std::nullopt);
    }

    // name@version
    size_t at_sign = rest.find('@');
    size_t angle = rest.find('<');
    if (at_sign != std::string::npos &&
        (angle == std::string::npos || at_sign < angle)) {
        std::string version = rest.substr(at_sign + 1);
        auto kind = classify_version(version);
        return make_dep(rest.substr(0, at_sign), std::move(version), kind, std::nullopt);
    }

    // name [url]
    if (auto at = match_suffix_group(rest, '[', ']')) {
        std::string url = rest.substr(*at + 2, rest.size() - *at - 3);
        return make_dep(rest.substr(0, *at), "source-control",
                        DependencyKind::SourceControl, std::move(url));
    }

    // name<url@version>
    if (auto span = match_angle_span(rest)) {
        auto [lt, gt] = *span;
        std::string payload = rest.substr(lt + 1, gt - lt - 1);
        std::string url = payload;
        std::string version = kUnspecified;
        size_t split = payload.find('@');
        if (split != std::string::npos) {
            url = payload.substr(0, split);
            version = payload.substr(split + 1);
        }
        return make_dep(rest.substr(0, lt), std::move(version),
                        DependencyKind::SourceControl, std::move(url));
    }

    return make_dep(rest, kUnspecified, DependencyKind::SourceControl, std::nullopt);
}

} // namespace spmsift

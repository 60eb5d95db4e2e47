#include <spmsift/log.hpp>
#include <spmsift/text.hpp>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace spmsift::log {

// Every line goes to stderr as "spmsift: <level>: <message>" so it never
// mixes with the analysis on stdout.

struct LevelInfo {
    Level level;
    const char* name;
    const char* color;
};

static const LevelInfo kLevels[] = {
    {Trace, "trace", "\033[90m"},
    {Debug, "debug", "\033[36m"},
    {Info,  "info",  "\033[32m"},
    {Warn,  "warn",  "\033[33m"},
    {Error, "error", "\033[31m"},
};

static const char* const kReset = "\033[0m";

static Level s_level = Warn;
static int s_color = -1;   // -1 until first use

static bool color_on() {
    if (s_color < 0) {
        // https://no-color.org
        const char* no_color = std::getenv("NO_COLOR");
        bool wanted = !(no_color && *no_color);
        s_color = (wanted && isatty(fileno(stderr))) ? 1 : 0;
    }
    return s_color == 1;
}

static const LevelInfo& info_for(Level lvl) {
    for (const auto& entry : kLevels) {
        if (entry.level == lvl) return entry;
    }
    return kLevels[0];
}

void set_level(Level lvl) { s_level = lvl; }
Level get_level() { return s_level; }

void set_color_enabled(bool enabled) { s_color = enabled ? 1 : 0; }
bool is_color_enabled() { return color_on(); }

const char* level_name(Level lvl) {
    return info_for(lvl).name;
}

Result<Level> parse_level(const std::string& name) {
    std::string key = text::to_lower(text::trim(name));
    if (key == "warning") key = "warn";
    for (const auto& entry : kLevels) {
        if (key == entry.name) return Result<Level>::ok(entry.level);
    }
    return SiftError{SiftError::InvalidArg,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

static void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;

    const LevelInfo& li = info_for(lvl);
    if (color_on()) {
        std::fprintf(stderr, "spmsift: %s%s%s: ", li.color, li.name, kReset);
    } else {
        std::fprintf(stderr, "spmsift: %s: ", li.name);
    }
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

#define SPMSIFT_LOG_AT(lvl)        \
    va_list args;                  \
    va_start(args, fmt);           \
    emit(lvl, fmt, args);          \
    va_end(args)

void trace(const char* fmt, ...) { SPMSIFT_LOG_AT(Trace); }
void debug(const char* fmt, ...) { SPMSIFT_LOG_AT(Debug); }
void info(const char* fmt, ...)  { SPMSIFT_LOG_AT(Info); }
void warn(const char* fmt, ...)  { SPMSIFT_LOG_AT(Warn); }
void error(const char* fmt, ...) { SPMSIFT_LOG_AT(Error); }

#undef SPMSIFT_LOG_AT

} // namespace spmsift::log

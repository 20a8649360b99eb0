#include <crock/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace crock::log {

// Generators may log from any thread, so the knobs are atomics.
static std::atomic<Level> s_level{Info};
static std::atomic<int> s_color{-1};  // -1 = not yet probed

static bool color_on() {
    int c = s_color.load();
    if (c < 0) {
        c = isatty(fileno(stderr)) ? 1 : 0;
        s_color.store(c);
    }
    return c == 1;
}

void set_level(Level lvl) {
    s_level.store(lvl);
}

Level get_level() {
    return s_level.load();
}

void set_color_enabled(bool enabled) {
    s_color.store(enabled ? 1 : 0);
}

bool is_color_enabled() {
    return color_on();
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

std::optional<Level> parse_level(const std::string& name) {
    if (name == "trace") return Trace;
    if (name == "debug") return Debug;
    if (name == "info") return Info;
    if (name == "warn" || name == "warning") return Warn;
    if (name == "error") return Error;
    return std::nullopt;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level.load()) return;

    if (color_on()) {
        std::fprintf(stderr, "%scrock %s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(stderr, "crock %s: ", level_name(lvl));
    }

    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace crock::log

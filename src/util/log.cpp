#include <crabby/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <mutex>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace crabby::log {

static std::atomic<Level> s_level{Info};
static std::mutex s_mutex;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(stderr));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_color_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    std::lock_guard<std::mutex> lock(s_mutex);
    init_color();
    return s_color_enabled;
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
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (lower == level_name(lvl)) return lvl;
    }
    if (lower == "warning") return Warn;
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

    char body[2048];
    std::vsnprintf(body, sizeof(body), fmt, args);

    std::lock_guard<std::mutex> lock(s_mutex);
    init_color();
    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s\033[0m: %s\n", level_color(lvl), level_name(lvl), body);
    } else {
        std::fprintf(stderr, "%s: %s\n", level_name(lvl), body);
    }
}

#define CRABBY_LOG_FN(fn, lvl)          \
    void fn(const char* fmt, ...) {     \
        va_list args;                   \
        va_start(args, fmt);            \
        log_message(lvl, fmt, args);    \
        va_end(args);                   \
    }

CRABBY_LOG_FN(trace, Trace)
CRABBY_LOG_FN(debug, Debug)
CRABBY_LOG_FN(info, Info)
CRABBY_LOG_FN(warn, Warn)
CRABBY_LOG_FN(error, Error)

#undef CRABBY_LOG_FN

} // namespace crabby::log

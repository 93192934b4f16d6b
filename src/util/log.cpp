#include <nodule/log.hpp>
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace nodule::log {

namespace {

struct LevelStyle {
    const char* name;
    const char* color;
};

// Indexed by Level
const LevelStyle STYLES[] = {
    {"trace", "\033[90m"},
    {"debug", "\033[36m"},
    {"info",  "\033[32m"},
    {"warn",  "\033[33m"},
    {"error", "\033[31m"},
};

const char RESET[] = "\033[0m";

struct State {
    Level threshold = Info;
    int color = -1;   // -1 until detected or set
};

State& state() {
    static State s;
    return s;
}

bool use_color() {
    State& s = state();
    if (s.color < 0) s.color = isatty(fileno(stderr)) ? 1 : 0;
    return s.color == 1;
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;
    const LevelStyle& style = STYLES[lvl];
    if (use_color()) {
        std::fprintf(stderr, "%s%s%s: ", style.color, style.name, RESET);
    } else {
        std::fprintf(stderr, "%s: ", style.name);
    }
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

} // namespace

void set_level(Level lvl) { state().threshold = lvl; }
Level get_level() { return state().threshold; }
bool enabled(Level lvl) { return lvl >= state().threshold; }

void set_color_enabled(bool enabled) { state().color = enabled ? 1 : 0; }
bool is_color_enabled() { return use_color(); }

const char* level_name(Level lvl) {
    if (lvl < Trace || lvl > Error) return "unknown";
    return STYLES[lvl].name;
}

Result<Level> parse_level(const std::string& name) {
    std::string lower(name.size(), '\0');
    std::transform(name.begin(), name.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "warning") return Result<Level>::ok(Warn);
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (lower == STYLES[lvl].name) return Result<Level>::ok(lvl);
    }
    return NoduleError{NoduleError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Error, fmt, args);
    va_end(args);
}

void status(const char* verb, const char* fmt, ...) {
    if (!enabled(Info)) return;
    if (use_color()) {
        std::fprintf(stderr, "\033[1;32m%12s%s ", verb, RESET);
    } else {
        std::fprintf(stderr, "%12s ", verb);
    }
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

} // namespace nodule::log

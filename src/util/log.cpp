#include <bibfmt/log.hpp>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace bibfmt::log {

namespace {

struct State {
    Level level = Info;
    bool color_initialized = false;
    bool color_enabled = false;
};

State& state() {
    static State s;
    return s;
}

void init_color() {
    auto& s = state();
    if (!s.color_initialized) {
        s.color_enabled = isatty(fileno(stderr));
        s.color_initialized = true;
    }
}

const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

} // anonymous namespace

void set_level(Level lvl) {
    state().level = lvl;
}

Level get_level() {
    return state().level;
}

void set_color_enabled(bool enabled) {
    state().color_enabled = enabled;
    state().color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return state().color_enabled;
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
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (name == level_name(lvl)) return lvl;
    }
    if (name == "warning") return Warn;
    return std::nullopt;
}

void vlog(Level lvl, const char* fmt, va_list args) {
    if (lvl < state().level) return;
    init_color();

    if (state().color_enabled) {
        std::fprintf(stderr, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }

    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

#define BIBFMT_LOG_FN(name, lvl) \
    void name(const char* fmt, ...) { \
        va_list args; \
        va_start(args, fmt); \
        vlog(lvl, fmt, args); \
        va_end(args); \
    }

BIBFMT_LOG_FN(trace, Trace)
BIBFMT_LOG_FN(debug, Debug)
BIBFMT_LOG_FN(info, Info)
BIBFMT_LOG_FN(warn, Warn)
BIBFMT_LOG_FN(error, Error)

#undef BIBFMT_LOG_FN

} // namespace bibfmt::log

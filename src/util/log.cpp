#include <hiecore/log.hpp>
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <mutex>
#include <optional>
#include <unistd.h>
#include <vector>

namespace hiecore::log {

namespace {

struct Sink {
    std::mutex mutex;
    Level level = Info;
    std::optional<bool> color;      // decided on first use unless forced
    std::FILE* out = nullptr;       // nullptr means stderr

    std::FILE* stream() const { return out ? out : stderr; }

    bool use_color() {
        if (!color) color = isatty(fileno(stream())) != 0;
        return *color;
    }
};

Sink& sink() {
    static Sink s;
    return s;
}

// Innermost Context of this thread first.
thread_local std::vector<std::string> t_context;

const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[31m";
    }
    return "";
}

std::string format_body(const char* fmt, va_list args) {
    va_list copy;
    va_copy(copy, args);
    int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n <= 0) return std::string();

    std::string body(static_cast<size_t>(n) + 1, '\0');
    std::vsnprintf(&body[0], body.size(), fmt, args);
    body.resize(static_cast<size_t>(n));
    return body;
}

void emit(Level lvl, const char* fmt, va_list args) {
    Sink& s = sink();
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        if (lvl < s.level) return;
    }

    // Formatting happens outside the lock; only the write is serialised.
    std::string body = format_body(fmt, args);
    std::string tag;
    if (!t_context.empty()) tag = "[" + t_context.back() + "] ";

    std::lock_guard<std::mutex> lock(s.mutex);
    std::string line;
    if (s.use_color()) {
        line = std::string(level_color(lvl)) + level_name(lvl) + "\033[0m: ";
    } else {
        line = std::string(level_name(lvl)) + ": ";
    }
    line += tag;
    line += body;
    line += '\n';

    std::FILE* out = s.stream();
    std::fwrite(line.data(), 1, line.size(), out);
    std::fflush(out);
}

} // namespace

void set_level(Level lvl) {
    std::lock_guard<std::mutex> lock(sink().mutex);
    sink().level = lvl;
}

Level get_level() {
    std::lock_guard<std::mutex> lock(sink().mutex);
    return sink().level;
}

void set_color_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(sink().mutex);
    sink().color = enabled;
}

bool is_color_enabled() {
    std::lock_guard<std::mutex> lock(sink().mutex);
    return sink().use_color();
}

void set_output(std::FILE* out) {
    std::lock_guard<std::mutex> lock(sink().mutex);
    sink().out = out;
}

Context::Context(std::string tag) {
    t_context.push_back(std::move(tag));
}

Context::~Context() {
    t_context.pop_back();
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

Result<Level> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Result<Level>::ok(Trace);
    if (lower == "debug") return Result<Level>::ok(Debug);
    if (lower == "info") return Result<Level>::ok(Info);
    if (lower == "warn" || lower == "warning") return Result<Level>::ok(Warn);
    if (lower == "error") return Result<Level>::ok(Error);

    return HieError{HieError::Config,
        "unknown log level: '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

#define HIECORE_LOG_FN(name, lvl)         \
    void name(const char* fmt, ...) {     \
        va_list args;                     \
        va_start(args, fmt);              \
        emit(lvl, fmt, args);             \
        va_end(args);                     \
    }

HIECORE_LOG_FN(trace, Trace)
HIECORE_LOG_FN(debug, Debug)
HIECORE_LOG_FN(info, Info)
HIECORE_LOG_FN(warn, Warn)
HIECORE_LOG_FN(error, Error)

#undef HIECORE_LOG_FN

} // namespace hiecore::log

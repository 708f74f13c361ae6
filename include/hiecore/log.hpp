#pragma once

#include <hiecore/result.hpp>
#include <cstdio>
#include <string>

namespace hiecore::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (defaults to stderr). Passing nullptr restores stderr.
void set_output(std::FILE* out);

// Tags every message this thread logs while it is alive, e.g. with the
// file being loaded. Nested contexts show the innermost tag only.
class Context {
public:
    explicit Context(std::string tag);
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
};

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// "trace", "debug", "info", "warn"/"warning", "error" (case-insensitive)
Result<Level> parse_level(const std::string& name);

} // namespace hiecore::log

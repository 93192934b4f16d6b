#pragma once

#include <nodule/result.hpp>
#include <string>
#include <cstdio>

namespace nodule::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Progress line at Info level: verb right-aligned in a 12-column gutter,
// e.g. "   Fetching lodash@4.17.21"
void status(const char* verb, const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// "trace" | "debug" | "info" | "warn" | "error" (case-insensitive)
Result<Level> parse_level(const std::string& name);

} // namespace nodule::log

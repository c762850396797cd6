#pragma once

#include <string>
#include <cstdio>

namespace sieve::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parse a level name ("trace" .. "error"). Returns false if unrecognized.
bool parse_level(const std::string& name, Level& out);

} // namespace sieve::log

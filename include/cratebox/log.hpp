#pragma once

#include <string>
#include <cstdio>

namespace cratebox::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

// Parse "trace", "debug", "info", "warn"/"warning" or "error".
// Returns false and leaves out untouched on anything else.
bool parse_level(const std::string& name, Level& out);

// Apply CRATEBOX_LOG from the environment, if set and valid
void init_from_env();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination for log lines, stderr by default. Passing nullptr restores stderr.
void set_output(std::FILE* out);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace cratebox::log

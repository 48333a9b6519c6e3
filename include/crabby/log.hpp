#pragma once

#include <optional>
#include <string>

namespace crabby::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Each call writes one complete line; safe to call from fetch workers.
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// "trace" .. "error", case-insensitive. nullopt for anything else.
std::optional<Level> parse_level(const std::string& name);

} // namespace crabby::log

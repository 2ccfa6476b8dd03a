// log.hpp - Leveled diagnostic lines on stderr ([stencil][level][component] message)
#pragma once
#include <string_view>

namespace stencil {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Threshold defaults to STENCIL_LOG (debug|info|warn|error|off), or warn when unset.
LogLevel log_level();
void set_log_level(LogLevel l);
bool log_enabled(LogLevel l);

// Parse a level name; returns `fallback` for unknown names.
LogLevel parse_log_level(std::string_view name, LogLevel fallback);

const char* to_string(LogLevel l);

#if defined(__GNUC__)
__attribute__((format(printf, 3, 4)))
#endif
void log_line(LogLevel level, const char* component, const char* fmt, ...);

} // namespace stencil

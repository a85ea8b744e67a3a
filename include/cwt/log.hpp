#pragma once
#include <functional>
#include <string>

namespace cwt {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

using LogSink = std::function<void(LogLevel, const std::string&)>;

// Replaces the process-wide sink. An empty sink restores the stderr default.
void set_log_sink(LogSink sink);
void set_log_level(LogLevel min_level);
LogLevel log_level();

const char* level_name(LogLevel level);

// printf-style; messages below the minimum level are dropped before formatting.
void log_message(LogLevel level, const char* fmt, ...);

void log_debug(const char* fmt, ...);
void log_info(const char* fmt, ...);
void log_warn(const char* fmt, ...);
void log_error(const char* fmt, ...);

} // namespace cwt

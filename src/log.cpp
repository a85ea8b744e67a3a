#include <cwt/log.hpp>
#include <cstdarg>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace cwt {

namespace {

void stderr_sink(LogLevel level, const std::string& msg) {
  std::fprintf(stderr, "[%s] %s\n", level_name(level), msg.c_str());
}

LogSink& sink_slot() {
  static LogSink sink = stderr_sink;
  return sink;
}

LogLevel& level_slot() {
  static LogLevel level = LogLevel::Info;
  return level;
}

} // namespace

void set_log_sink(LogSink sink) {
  sink_slot() = sink ? std::move(sink) : LogSink(stderr_sink);
}

void set_log_level(LogLevel min_level) { level_slot() = min_level; }

LogLevel log_level() { return level_slot(); }

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "?";
}

namespace {

void vlog(LogLevel level, const char* fmt, va_list args) {
  if (static_cast<int>(level) < static_cast<int>(level_slot())) return;

  char small[256];
  va_list copy;
  va_copy(copy, args);
  const int n = std::vsnprintf(small, sizeof(small), fmt, args);

  std::string msg;
  if (n < 0) {
    msg = fmt;
  } else if (static_cast<std::size_t>(n) < sizeof(small)) {
    msg.assign(small, static_cast<std::size_t>(n));
  } else {
    std::vector<char> big(static_cast<std::size_t>(n) + 1);
    std::vsnprintf(big.data(), big.size(), fmt, copy);
    msg.assign(big.data(), static_cast<std::size_t>(n));
  }
  va_end(copy);

  sink_slot()(level, msg);
}

} // namespace

void log_message(LogLevel level, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(level, fmt, args);
  va_end(args);
}

void log_debug(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(LogLevel::Debug, fmt, args);
  va_end(args);
}

void log_info(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(LogLevel::Info, fmt, args);
  va_end(args);
}

void log_warn(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(LogLevel::Warn, fmt, args);
  va_end(args);
}

void log_error(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(LogLevel::Error, fmt, args);
  va_end(args);
}

} // namespace cwt

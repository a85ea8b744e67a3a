#include <cwt/event_log.hpp>
#include <cstdio>
#include <cwt/log.hpp>

namespace cwt {

const char* to_string(LogEventKind kind) {
  switch (kind) {
    case LogEventKind::SessionStart: return "sessionStart";
    case LogEventKind::SessionEnd:   return "sessionEnd";
    case LogEventKind::Emission:     return "emission";
    case LogEventKind::Correct:      return "correct";
    case LogEventKind::Incorrect:    return "incorrect";
    case LogEventKind::Timeout:      return "timeout";
  }
  return "?";
}

static char printable(char c) { return c == '\0' ? '-' : c; }

static std::string format_word_event(const LogEvent& ev) {
  char buf[160];
  switch (ev.kind) {
    case LogEventKind::Correct:
      std::snprintf(buf, sizeof(buf), "%-12s %9.1f \"%s\" latency=%.1fms",
                    to_string(ev.kind), ev.at, ev.word.c_str(), ev.latency_ms);
      break;
    case LogEventKind::Incorrect:
      std::snprintf(buf, sizeof(buf), "%-12s %9.1f \"%s\" got \"%s\"",
                    to_string(ev.kind), ev.at, ev.word.c_str(), ev.got_word.c_str());
      break;
    default:
      std::snprintf(buf, sizeof(buf), "%-12s %9.1f \"%s\"", to_string(ev.kind), ev.at,
                    ev.word.c_str());
      break;
  }
  return buf;
}

std::string format_event(const LogEvent& ev) {
  if (ev.is_word()) return format_word_event(ev);
  char buf[96];
  switch (ev.kind) {
    case LogEventKind::SessionStart:
    case LogEventKind::SessionEnd:
      std::snprintf(buf, sizeof(buf), "%-12s %9.1f", to_string(ev.kind), ev.at);
      break;
    case LogEventKind::Correct:
      std::snprintf(buf, sizeof(buf), "%-12s %9.1f '%c' latency=%.1fms",
                    to_string(ev.kind), ev.at, ev.ch, ev.latency_ms);
      break;
    case LogEventKind::Incorrect:
      std::snprintf(buf, sizeof(buf), "%-12s %9.1f '%c' got '%c'",
                    to_string(ev.kind), ev.at, ev.ch, printable(ev.got));
      break;
    case LogEventKind::Emission:
    case LogEventKind::Timeout:
      std::snprintf(buf, sizeof(buf), "%-12s %9.1f '%c'", to_string(ev.kind), ev.at, ev.ch);
      break;
  }
  return buf;
}

bool EventLog::append(const LogEvent& ev) {
  if (!events_.empty() && ev.at < events_.back().at) return false;
  events_.push_back(ev);
  ++seq_;
  return true;
}

bool EventLog::read_since(std::size_t& cursor, std::vector<LogEvent>& out) const {
  if (cursor >= events_.size()) return false;
  out.insert(out.end(), events_.begin() + static_cast<std::ptrdiff_t>(cursor), events_.end());
  cursor = events_.size();
  return true;
}

bool append_or_warn(EventLog& log, const LogEvent& ev) {
  if (log.append(ev)) return true;
  log_warn("event log: dropped %s at %.1f, last entry is at %.1f", to_string(ev.kind), ev.at,
           log.events().back().at);
  return false;
}

} // namespace cwt

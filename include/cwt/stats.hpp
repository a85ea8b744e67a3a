#pragma once
#include <map>
#include <optional>
#include <vector>
#include <cwt/clock.hpp>
#include <cwt/config.hpp>
#include <cwt/event_log.hpp>

namespace cwt {

struct CharStats {
  char ch = '\0';
  int attempts = 0;
  int correct = 0;
  int incorrect = 0;
  int timeout = 0;
  double accuracy = 0.0; // percent of attempts
  double mean_latency_ms = 0.0;
  double median_latency_ms = 0.0;
  std::vector<Millis> latencies;
};

struct SessionStats {
  Millis started_at = 0.0;
  Millis ended_at = 0.0;
  Millis duration_ms = 0.0;
  int total = 0;
  int correct = 0;
  int incorrect = 0;
  int timeout = 0;
  double accuracy = 0.0;           // over correct + incorrect; timeouts excluded
  double timeout_percentage = 0.0; // over all outcomes
  double mean_latency_ms = 0.0;
  double median_latency_ms = 0.0;
  int achieved_wpm = 0;
  std::map<char, CharStats> per_char;
  std::map<char, std::map<char, int>> confusion; // expected -> got -> count
};

// std::nullopt unless the log holds both a sessionStart and a sessionEnd.
std::optional<SessionStats> compute_session_stats(const std::vector<LogEvent>& events,
                                                  SessionMode mode = SessionMode::Practice);

double mean_of(const std::vector<Millis>& v);
double median_of(std::vector<Millis> v);

} // namespace cwt

#include <cwt/stats.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace cwt {

double mean_of(const std::vector<Millis>& v) {
  if (v.empty()) return 0.0;
  return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double median_of(std::vector<Millis> v) {
  if (v.empty()) return 0.0;
  std::sort(v.begin(), v.end());
  const std::size_t mid = v.size() / 2;
  if (v.size() % 2 == 0) return (v[mid - 1] + v[mid]) / 2.0;
  return v[mid];
}

static CharStats& char_entry(std::map<char, CharStats>& m, char c) {
  auto& s = m[c];
  s.ch = c;
  ++s.attempts;
  return s;
}

// Net correct characters per second, times 60 s / 5 chars per word.
static int achieved_wpm(int correct, int incorrect, Millis duration_ms, SessionMode mode) {
  if (mode == SessionMode::Listen || mode == SessionMode::WordPractice) return 0;
  if (duration_ms <= 0.0) return 0;
  const int net = correct - incorrect;
  if (net <= 0) return 0;
  return static_cast<int>(std::lround(net / (duration_ms / 1000.0) * 12.0));
}

std::optional<SessionStats> compute_session_stats(const std::vector<LogEvent>& events,
                                                  SessionMode mode) {
  auto find_kind = [&](LogEventKind k) {
    return std::find_if(events.begin(), events.end(),
                        [k](const LogEvent& e) { return e.kind == k; });
  };
  const auto start = find_kind(LogEventKind::SessionStart);
  const auto end = find_kind(LogEventKind::SessionEnd);
  if (start == events.end() || end == events.end()) return std::nullopt;

  SessionStats s;
  s.started_at = start->at;
  s.ended_at = end->at;
  s.duration_ms = end->at - start->at;

  std::vector<Millis> latencies;
  for (const auto& e : events) {
    // Inter-word gaps are not answers.
    if (e.is_outcome() && e.ch == ' ') continue;
    if (e.is_word()) {
      // Word outcomes count toward the totals only.
      if (e.kind == LogEventKind::Correct) {
        ++s.correct;
        latencies.push_back(e.latency_ms);
      } else if (e.kind == LogEventKind::Incorrect) {
        ++s.incorrect;
      } else if (e.kind == LogEventKind::Timeout) {
        ++s.timeout;
      }
      continue;
    }
    switch (e.kind) {
      case LogEventKind::Correct: {
        ++s.correct;
        latencies.push_back(e.latency_ms);
        auto& cs = char_entry(s.per_char, e.ch);
        ++cs.correct;
        cs.latencies.push_back(e.latency_ms);
        break;
      }
      case LogEventKind::Incorrect:
        ++s.incorrect;
        ++char_entry(s.per_char, e.ch).incorrect;
        ++s.confusion[e.ch][e.got];
        break;
      case LogEventKind::Timeout:
        ++s.timeout;
        ++char_entry(s.per_char, e.ch).timeout;
        break;
      default:
        break;
    }
  }

  for (auto& [c, cs] : s.per_char) {
    cs.accuracy = cs.attempts > 0 ? 100.0 * cs.correct / cs.attempts : 0.0;
    cs.mean_latency_ms = mean_of(cs.latencies);
    cs.median_latency_ms = median_of(cs.latencies);
  }

  s.total = s.correct + s.incorrect + s.timeout;
  const int attempts = s.correct + s.incorrect;
  s.accuracy = attempts > 0 ? 100.0 * s.correct / attempts : 0.0;
  s.timeout_percentage = s.total > 0 ? 100.0 * s.timeout / s.total : 0.0;
  s.mean_latency_ms = mean_of(latencies);
  s.median_latency_ms = median_of(latencies);
  s.achieved_wpm = achieved_wpm(s.correct, s.incorrect, s.duration_ms, mode);
  return s;
}

} // namespace cwt

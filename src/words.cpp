#include <cwt/words.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <utility>
#include <cwt/alphabet.hpp>

namespace cwt {

namespace {

struct SubstituteRow {
  char c;
  const char* similar;
};

// Neighbours by pattern: extra or missing elements, inverted dit/dah.
constexpr std::array<SubstituteRow, 50> kSubstitutes{{
  {'0', "98O"}, {'1', "2JQ"}, {'2', "13U"}, {'3', "24V"}, {'4', "35H"},
  {'5', "46S"}, {'6', "57B"}, {'7', "68Z"}, {'8', "79O"}, {'9', "08Q"},
  {'A', "NRW"}, {'B', "D6V"}, {'C', "KYR"}, {'D', "BNX"}, {'E', "ITS"},
  {'F', "LUR"}, {'G', "MZO"}, {'H', "S54"}, {'I', "ESU"}, {'J', "1WP"},
  {'K', "CNR"}, {'L', "RFA"}, {'M', "NTO"}, {'N', "MTD"}, {'O', "M08"},
  {'P', "WJA"}, {'Q', "GZY"}, {'R', "ALK"}, {'S', "EIH"}, {'T', "MNE"},
  {'U', "VIF"}, {'V', "U4B"}, {'W', "AJP"}, {'X', "DBK"}, {'Y', "KCQ"},
  {'Z', "GQ7"},
  {',', "ZGQ"}, {'.', "RL+"}, {'/', "BD="}, {'=', "BD/"}, {'?', "2UW"},
  {':', "O80"}, {';', "CKY"}, {'(', "YKQ"}, {')', "YK("}, {'"', "LRF"},
  {'\'', "1J0"}, {'-', "B6D"}, {'+', ".RL"}, {'@', "WPA"},
}};

char keep_case(char original, char substitute) {
  if (std::islower(static_cast<unsigned char>(original))) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(substitute)));
  }
  return substitute;
}

std::optional<std::string> one_distractor(const std::string& word,
                                          const std::vector<std::string>& exclude,
                                          std::mt19937& rng) {
  constexpr int kMaxAttempts = 50;
  std::vector<std::size_t> positions;
  for (std::size_t i = 0; i < word.size(); ++i) positions.push_back(i);

  for (int attempt = 0; attempt < kMaxAttempts && !positions.empty(); ++attempt) {
    std::uniform_int_distribution<std::size_t> pick_pos(0, positions.size() - 1);
    const std::size_t slot = pick_pos(rng);
    const std::size_t pos = positions[slot];
    const auto similar = morse_substitutes(word[pos]);
    if (similar.empty()) {
      positions.erase(positions.begin() + static_cast<std::ptrdiff_t>(slot));
      continue;
    }
    std::uniform_int_distribution<std::size_t> pick_sub(0, similar.size() - 1);
    std::string candidate = word;
    candidate[pos] = keep_case(word[pos], similar[pick_sub(rng)]);
    if (std::find(exclude.begin(), exclude.end(), candidate) == exclude.end()) return candidate;
  }
  return std::nullopt;
}

} // namespace

std::string_view morse_substitutes(char c) {
  const char u = to_upper_ascii(c);
  for (const auto& row : kSubstitutes) {
    if (row.c == u) return row.similar;
  }
  return {};
}

std::optional<std::vector<std::string>> fallback_distractors(const std::string& word,
                                                             std::mt19937& rng) {
  std::vector<std::string> seen{word};
  std::vector<std::string> out;
  for (int i = 0; i < 2; ++i) {
    auto d = one_distractor(word, seen, rng);
    if (!d) return std::nullopt;
    seen.push_back(*d);
    out.push_back(std::move(*d));
  }
  return out;
}

std::vector<std::string> parse_word_list(const std::string& text) {
  std::vector<std::string> words;
  std::string cur;
  auto flush = [&] {
    if (!cur.empty() && std::find(words.begin(), words.end(), cur) == words.end()) {
      words.push_back(cur);
    }
    cur.clear();
  };
  for (char c : text) {
    // ',' has a pattern but separates list entries here.
    if (c == ',' || std::isspace(static_cast<unsigned char>(c))) { flush(); continue; }
    const char u = to_upper_ascii(c);
    if (is_morse_char(u)) cur.push_back(u);
  }
  flush();
  return words;
}

const std::vector<std::string>& default_word_list() {
  static const std::vector<std::string> words{
    "THE", "AND", "FOR", "ARE", "BUT", "NOT", "YOU", "ALL", "ANY", "CAN",
    "HAD", "HER", "WAS", "ONE", "OUR", "OUT", "DAY", "GET", "HAS", "HIM",
    "HOW", "MAN", "NEW", "NOW", "OLD", "SEE", "TWO", "WAY", "WHO", "RIG",
    "ANT", "QTH", "RST", "CQ", "DE", "TNX", "FB", "OM", "WX", "73",
  };
  return words;
}

WordListSource::WordListSource(std::vector<std::string> words, std::uint32_t seed)
  : words_(std::move(words)), seed_(seed), rng_(seed) {
  if (words_.empty()) words_ = default_word_list();
}

WordEntry WordListSource::next() {
  std::uniform_int_distribution<std::size_t> pick(0, words_.size() - 1);
  WordEntry e;
  e.word = words_[pick(rng_)];
  if (auto d = fallback_distractors(e.word, rng_)) e.distractors = std::move(*d);
  return e;
}

void WordListSource::reset() {
  rng_.seed(seed_);
}

} // namespace cwt

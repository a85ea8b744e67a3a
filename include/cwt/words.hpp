#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace cwt {

// Characters whose Morse pattern is easily confused with c (upper case).
// Empty for characters without a pattern.
std::string_view morse_substitutes(char c);

// Two distinct words, each differing from word in one position by a
// Morse-similar character. Case of the replaced character is kept.
// std::nullopt if no two unique candidates can be built.
std::optional<std::vector<std::string>> fallback_distractors(const std::string& word,
                                                             std::mt19937& rng);

struct WordEntry {
  std::string word;
  std::vector<std::string> distractors;
};

// Upper-cased, sendable words from a comma or whitespace separated list.
std::vector<std::string> parse_word_list(const std::string& text);

const std::vector<std::string>& default_word_list();

// Uniform picks from a word list, each paired with fallback distractors.
// The same seed replays the same sequence.
class WordListSource {
public:
  WordListSource(std::vector<std::string> words, std::uint32_t seed = 0);

  WordEntry next();
  void reset();
  std::size_t size() const { return words_.size(); }

private:
  std::vector<std::string> words_;
  std::uint32_t seed_;
  std::mt19937 rng_;
};

} // namespace cwt

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cwt {

// International Morse patterns written as '.' (dit) and '-' (dah).
// Lookup is case-insensitive; std::nullopt for characters without a pattern.
std::optional<std::string_view> morse_pattern(char c);

bool is_morse_char(char c);

// A key a learner can answer with: one character that has a pattern, or space.
bool is_valid_key(const std::string& key);

char to_upper_ascii(char c);
bool same_char_ci(char a, char b);

struct CharacterCategories {
  std::vector<char> letters;
  std::vector<char> numbers;
  std::vector<char> standard_punctuation;
  std::vector<char> advanced_punctuation;
};

const CharacterCategories& character_categories();

} // namespace cwt

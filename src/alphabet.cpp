#include <cwt/alphabet.hpp>
#include <array>
#include <cctype>

namespace cwt {

namespace {

struct PatternRow {
  char c;
  const char* pattern;
};

constexpr std::array<PatternRow, 50> kTable{{
  {'A', ".-"},     {'B', "-..."},   {'C', "-.-."},   {'D', "-.."},
  {'E', "."},      {'F', "..-."},   {'G', "--."},    {'H', "...."},
  {'I', ".."},     {'J', ".---"},   {'K', "-.-"},    {'L', ".-.."},
  {'M', "--"},     {'N', "-."},     {'O', "---"},    {'P', ".--."},
  {'Q', "--.-"},   {'R', ".-."},    {'S', "..."},    {'T', "-"},
  {'U', "..-"},    {'V', "...-"},   {'W', ".--"},    {'X', "-..-"},
  {'Y', "-.--"},   {'Z', "--.."},
  {'0', "-----"},  {'1', ".----"},  {'2', "..---"},  {'3', "...--"},
  {'4', "....-"},  {'5', "....."},  {'6', "-...."},  {'7', "--..."},
  {'8', "---.."},  {'9', "----."},
  // standard punctuation
  {',', "--..--"}, {'.', ".-.-.-"}, {'/', "-..-."},  {'=', "-...-"},
  {'?', "..--.."},
  // advanced punctuation
  {':', "---..."}, {';', "-.-.-."}, {'(', "-.--."},  {')', "-.--.-"},
  {'"', ".-..-."}, {'\'', ".----."}, {'-', "-....-"}, {'+', ".-.-."},
  {'@', ".--.-."},
}};

} // namespace

char to_upper_ascii(char c) {
  return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

bool same_char_ci(char a, char b) {
  return to_upper_ascii(a) == to_upper_ascii(b);
}

std::optional<std::string_view> morse_pattern(char c) {
  const char u = to_upper_ascii(c);
  for (const auto& row : kTable) {
    if (row.c == u) return std::string_view(row.pattern);
  }
  return std::nullopt;
}

bool is_morse_char(char c) {
  return morse_pattern(c).has_value();
}

bool is_valid_key(const std::string& key) {
  if (key.size() != 1) return false;
  return key[0] == ' ' || is_morse_char(key[0]);
}

const CharacterCategories& character_categories() {
  static const CharacterCategories cats = [] {
    CharacterCategories c;
    for (const auto& row : kTable) {
      if (row.c >= 'A' && row.c <= 'Z') c.letters.push_back(row.c);
      else if (row.c >= '0' && row.c <= '9') c.numbers.push_back(row.c);
    }
    c.standard_punctuation = {',', '.', '/', '=', '?'};
    c.advanced_punctuation = {':', ';', '(', ')', '"', '\'', '-', '+', '@'};
    return c;
  }();
  return cats;
}

} // namespace cwt

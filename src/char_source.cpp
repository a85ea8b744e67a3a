#include <cwt/char_source.hpp>
#include <utility>
#include <cwt/alphabet.hpp>

namespace cwt {

RandomCharSource::RandomCharSource(std::string alphabet, std::uint32_t seed)
  : alphabet_(std::move(alphabet)), seed_(seed), rng_(seed) {
  if (alphabet_.empty()) alphabet_ = "E";
}

char RandomCharSource::next() {
  std::uniform_int_distribution<std::size_t> pick(0, alphabet_.size() - 1);
  return alphabet_[pick(rng_)];
}

void RandomCharSource::reset() {
  rng_.seed(seed_);
}

TextCharSource::TextCharSource(const std::string& text) {
  // Keep characters that can be sent; collapse runs of whitespace to one space.
  for (char c : text) {
    const char u = to_upper_ascii(c);
    if (is_morse_char(u)) {
      text_.push_back(u);
    } else if ((c == ' ' || c == '\t' || c == '\n') && !text_.empty() && text_.back() != ' ') {
      text_.push_back(' ');
    }
  }
  while (!text_.empty() && text_.back() == ' ') text_.pop_back();
  if (text_.empty()) text_ = "E";
}

char TextCharSource::next() {
  if (pos_ >= text_.size()) {
    pos_ = 0;
    wrapped_ = true;
  }
  return text_[pos_++];
}

} // namespace cwt

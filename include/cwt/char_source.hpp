#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace cwt {

// Supplies the characters a session transmits.
class CharSource {
public:
  virtual ~CharSource() = default;
  virtual char next() = 0;
  virtual void reset() = 0;
};

// Uniform picks from an alphabet. The same seed replays the same sequence.
class RandomCharSource : public CharSource {
public:
  explicit RandomCharSource(std::string alphabet, std::uint32_t seed = 0);

  char next() override;
  void reset() override;

private:
  std::string alphabet_;
  std::uint32_t seed_;
  std::mt19937 rng_;
};

// Fixed text, upper-cased, repeated from the start once exhausted.
class TextCharSource : public CharSource {
public:
  explicit TextCharSource(const std::string& text);

  char next() override;
  void reset() override { pos_ = 0; }
  bool wrapped() const { return wrapped_; }
  std::size_t size() const { return text_.size(); }

private:
  std::string text_;
  std::size_t pos_{0};
  bool wrapped_{false};
};

} // namespace cwt

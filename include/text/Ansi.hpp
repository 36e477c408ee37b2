#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace inkwell::text {

inline constexpr std::string_view kSgrReset = "\x1B[0m";

// One unit of a styled string: a visible grapheme cluster or a zero-width
// escape sequence. Views point into the tokenized string.
struct Token {
  enum class Kind { Grapheme, Escape };
  Kind kind{Kind::Grapheme};
  std::string_view bytes;
  int col{0};    // visual column where the token starts
  int width{0};  // always 0 for escapes
};

// Byte length of the escape sequence starting at s[i] (s[i] must be ESC).
// Unterminated or malformed sequences end where the malformation starts,
// a lone trailing ESC is one byte.
size_t escape_len(std::string_view s, size_t i);

[[nodiscard]] bool is_sgr(std::string_view esc);

std::vector<Token> tokenize(std::string_view s);

std::string strip_ansi(std::string_view s);

// True when the SGR escapes in `s` leave a style active at its end
[[nodiscard]] bool leaves_style_open(std::string_view s);

// Running SGR style state. One slot per attribute or color holds the raw
// parameters that set it, in the order the slots were first set, so a fragment
// can restore its style with at most one escape per open attribute.
class SgrState {
public:
  void apply(std::string_view esc);
  void reset();

  [[nodiscard]] bool active() const { return !slots_.empty(); }
  [[nodiscard]] const std::string& replay() const { return replay_; }

private:
  void set_slot(int key, std::string params);
  void clear_slot(int key);

  // key: attribute code (1..9, 53), or 38/48/58 for fg/bg/underline color
  std::vector<std::pair<int, std::string>> slots_;
  std::string replay_;
};

} // namespace inkwell::text

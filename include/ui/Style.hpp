#pragma once

#include "model/Node.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace inkwell::ui {

enum class ColorLevel { None, Basic, Ansi256, TrueColor };

enum class ColorTarget { Foreground, Background };

struct Rgb { int r{0}; int g{0}; int b{0}; };

// Parsed color: a palette index (0..255) or an RGB triple
struct Color {
  std::optional<int> index;
  std::optional<Rgb> rgb;
};

// Accepts names ("red", "brightBlue", "gray"), "#rrggbb", "#rgb",
// "rgb(r, g, b)" and "ansi256(n)"
[[nodiscard]] std::optional<Color> parse_color(std::string_view value);

[[nodiscard]] int rgb_to_ansi256(int r, int g, int b);
[[nodiscard]] int ansi256_to_basic(int idx);

// Opening SGR for a color at the given level, empty when unknown or disabled
[[nodiscard]] std::string color_open(std::string_view value, ColorTarget target, ColorLevel level);

// Wrap text in a color. Every line is wrapped on its own so lines can be
// placed independently.
[[nodiscard]] std::string colorize(std::string_view text, std::string_view value,
                                   ColorTarget target, ColorLevel level);

[[nodiscard]] std::string apply_text_style(std::string_view text, const model::TextStyle& style,
                                           ColorLevel level);

} // namespace inkwell::ui

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace inkwell::text {

inline constexpr std::string_view kEllipsis = "\xE2\x80\xA6"; // U+2026

enum class TruncateAnchor { End, Start, Middle };

struct WrapOptions {
  bool hard{false}; // break words wider than the line
};

struct TextSize {
  int width{0};
  int height{0};
  bool operator==(const TextSize&) const = default;
};

// Visual columns of one line: escapes 0, wide graphemes 2, combining 0
[[nodiscard]] int visual_width(std::string_view s);

// Visual columns [start, end). Styles active at `start` are replayed, escapes
// inside the range are carried, and a trailing reset closes any style left
// open. Wide graphemes cut by a boundary become spaces.
[[nodiscard]] std::string slice_columns(std::string_view s, int start, int end);
[[nodiscard]] std::string slice_columns(std::string_view s, int start);

std::vector<std::string_view> split_lines(std::string_view s);

// Word wrap at spaces. Each input line is wrapped on its own; lines that
// already fit come back unchanged. max_width <= 0 returns the input lines.
std::vector<std::string> wrap(std::string_view s, int max_width, WrapOptions opts = {});
std::string wrap_text(std::string_view s, int max_width, WrapOptions opts = {});

// Replace removed content with a single ellipsis. Content that fits is
// returned as is; a width of 1 or less leaves only the ellipsis.
std::string truncate(std::string_view s, int max_width, TruncateAnchor anchor = TruncateAnchor::End);

// Widest line and line count, memoized
TextSize measure_text(const std::string& s);
int widest_line(const std::string& s);
void clear_measure_cache();
size_t measure_cache_size();

// Size of `s` once wrapped to max_width; intrinsic size for text nodes
TextSize measure_wrapped(std::string_view s, int max_width);

} // namespace inkwell::text

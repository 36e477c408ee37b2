#include "ui/Style.hpp"
#include "ui/Terminal.hpp"
#include "text/Metrics.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <utility>

namespace inkwell::ui {

namespace {

struct Named { const char* name; int idx; };

constexpr std::array<Named, 18> kNamed{{
  {"black", 0}, {"red", 1}, {"green", 2}, {"yellow", 3},
  {"blue", 4}, {"magenta", 5}, {"cyan", 6}, {"white", 7},
  {"gray", 8}, {"grey", 8}, {"blackBright", 8},
  {"brightRed", 9}, {"brightGreen", 10}, {"brightYellow", 11},
  {"brightBlue", 12}, {"brightMagenta", 13}, {"brightCyan", 14}, {"brightWhite", 15},
}};

// xterm values of the 16 base colors, for downgrading to the basic palette
constexpr std::array<Rgb, 16> kBase{{
  {0,0,0}, {205,0,0}, {0,205,0}, {205,205,0}, {0,0,238}, {205,0,205}, {0,205,205}, {229,229,229},
  {127,127,127}, {255,0,0}, {0,255,0}, {255,255,0}, {92,92,255}, {255,0,255}, {0,255,255}, {255,255,255},
}};

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = (char)std::tolower((unsigned char)c);
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

std::optional<Rgb> parse_hex(std::string_view s) {
  if (s.size() != 3 && s.size() != 6) return std::nullopt;
  int v[6];
  for (size_t i = 0; i < s.size(); ++i) {
    v[i] = hex_digit(s[i]);
    if (v[i] < 0) return std::nullopt;
  }
  if (s.size() == 3) return Rgb{v[0] * 17, v[1] * 17, v[2] * 17};
  return Rgb{v[0] * 16 + v[1], v[2] * 16 + v[3], v[4] * 16 + v[5]};
}

// Comma separated integers inside "name(...)"
bool parse_args(std::string_view s, int* out, int n) {
  int got = 0;
  size_t i = 0;
  while (i < s.size() && got < n) {
    while (i < s.size() && (s[i] == ' ' || s[i] == ',')) ++i;
    int v = 0;
    auto [p, ec] = std::from_chars(s.data() + i, s.data() + s.size(), v);
    if (ec != std::errc()) return false;
    out[got++] = v;
    i = (size_t)(p - s.data());
  }
  while (i < s.size() && s[i] == ' ') ++i;
  return got == n && i == s.size();
}

std::optional<std::string_view> call_args(std::string_view s, std::string_view fn) {
  if (!s.starts_with(fn) || s.size() < fn.size() + 2) return std::nullopt;
  if (s[fn.size()] != '(' || s.back() != ')') return std::nullopt;
  return s.substr(fn.size() + 1, s.size() - fn.size() - 2);
}

std::string basic_code(int idx, ColorTarget target) {
  return sgr_palette_idx(idx, target == ColorTarget::Background);
}

} // namespace

std::optional<Color> parse_color(std::string_view value) {
  if (value.empty()) return std::nullopt;
  if (value.front() == '#') {
    auto rgb = parse_hex(value.substr(1));
    if (!rgb) return std::nullopt;
    return Color{std::nullopt, rgb};
  }
  if (auto a = call_args(value, "rgb")) {
    int v[3];
    if (!parse_args(*a, v, 3)) return std::nullopt;
    return Color{std::nullopt, Rgb{std::clamp(v[0],0,255), std::clamp(v[1],0,255), std::clamp(v[2],0,255)}};
  }
  if (auto a = call_args(value, "ansi256")) {
    int v[1];
    if (!parse_args(*a, v, 1) || v[0] < 0 || v[0] > 255) return std::nullopt;
    return Color{v[0], std::nullopt};
  }
  for (const auto& n : kNamed) {
    if (value == n.name) return Color{n.idx, std::nullopt};
  }
  return std::nullopt;
}

int rgb_to_ansi256(int r, int g, int b) {
  if (r == g && g == b) {
    if (r < 8) return 16;
    if (r > 248) return 231;
    return (int)std::lround(((r - 8) / 247.0) * 24) + 232;
  }
  return 16 + 36 * (int)std::lround(r / 255.0 * 5) + 6 * (int)std::lround(g / 255.0 * 5) +
         (int)std::lround(b / 255.0 * 5);
}

int ansi256_to_basic(int idx) {
  if (idx < 16) return idx;
  int r, g, b;
  if (idx >= 232) {
    r = g = b = (idx - 232) * 10 + 8;
  } else {
    int c = idx - 16;
    auto level = [](int v) { return v == 0 ? 0 : 55 + v * 40; };
    r = level(c / 36); g = level((c / 6) % 6); b = level(c % 6);
  }
  int best = 0;
  long best_d = -1;
  for (int i = 0; i < 16; ++i) {
    long dr = r - kBase[(size_t)i].r, dg = g - kBase[(size_t)i].g, db = b - kBase[(size_t)i].b;
    long d = dr * dr + dg * dg + db * db;
    if (best_d < 0 || d < best_d) { best_d = d; best = i; }
  }
  return best;
}

std::string color_open(std::string_view value, ColorTarget target, ColorLevel level) {
  if (level == ColorLevel::None) return {};
  auto c = parse_color(value);
  if (!c) return {};
  bool bg = target == ColorTarget::Background;
  if (c->rgb) {
    const Rgb& v = *c->rgb;
    if (level == ColorLevel::TrueColor) return sgr_truecolor(v.r, v.g, v.b, bg);
    int idx = rgb_to_ansi256(v.r, v.g, v.b);
    if (level == ColorLevel::Ansi256) return sgr_palette_idx(idx, bg);
    return basic_code(ansi256_to_basic(idx), target);
  }
  int idx = *c->index;
  if (level == ColorLevel::Basic) idx = ansi256_to_basic(idx);
  return sgr_palette_idx(idx, bg);
}

namespace {

std::string wrap_lines(std::string_view text, const std::string& open, const char* close) {
  if (open.empty() || text.empty()) return std::string(text);
  std::string out;
  auto lines = text::split_lines(text);
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) out += '\n';
    if (lines[i].empty()) continue;
    out += open;
    out += lines[i];
    out += close;
  }
  return out;
}

} // namespace

std::string colorize(std::string_view text, std::string_view value, ColorTarget target, ColorLevel level) {
  return wrap_lines(text, color_open(value, target, level),
                    target == ColorTarget::Background ? "\x1B[49m" : "\x1B[39m");
}

std::string apply_text_style(std::string_view text, const model::TextStyle& style, ColorLevel level) {
  std::string out(text);
  if (level == ColorLevel::None) return out;
  if (style.dim) out = wrap_lines(out, sgr("2"), "\x1B[22m");
  if (!style.color.empty()) out = colorize(out, style.color, ColorTarget::Foreground, level);
  if (!style.background.empty()) out = colorize(out, style.background, ColorTarget::Background, level);
  if (style.bold) out = wrap_lines(out, sgr("1"), "\x1B[22m");
  if (style.italic) out = wrap_lines(out, sgr("3"), "\x1B[23m");
  if (style.underline) out = wrap_lines(out, sgr("4"), "\x1B[24m");
  if (style.strikethrough) out = wrap_lines(out, sgr("9"), "\x1B[29m");
  if (style.inverse) out = wrap_lines(out, sgr("7"), "\x1B[27m");
  return out;
}

} // namespace inkwell::ui

#include "text/Ansi.hpp"
#include "util/CharWidth.hpp"
#include <algorithm>
#include <charconv>

namespace inkwell::text {

size_t escape_len(std::string_view s, size_t i) {
  if (i + 1 >= s.size()) return 1;
  char kind = s[i + 1];
  size_t j = i + 2;
  if (kind == '[') {
    // CSI: parameter and intermediate bytes, then one final byte
    while (j < s.size() && s[j] >= 0x20 && s[j] <= 0x3F) j++;
    while (j < s.size() && s[j] >= 0x20 && s[j] <= 0x2F) j++;
    if (j < s.size() && s[j] >= 0x40 && s[j] <= 0x7E) j++;
    return j - i;
  }
  if (kind == ']' || kind == 'P' || kind == '_' || kind == '^') {
    // String sequences end with ST (ESC \), OSC also accepts BEL
    while (j < s.size()) {
      if (kind == ']' && s[j] == '\x07') return j + 1 - i;
      if (s[j] == '\x1B') {
        if (j + 1 < s.size() && s[j + 1] == '\\') return j + 2 - i;
        return j - i;
      }
      j++;
    }
    return j - i;
  }
  if (kind >= 0x20 && kind <= 0x2F) {
    // nF escapes: intermediates then a final byte
    while (j < s.size() && s[j] >= 0x20 && s[j] <= 0x2F) j++;
    if (j < s.size() && s[j] >= 0x30 && s[j] <= 0x7E) j++;
    return j - i;
  }
  return 2;
}

bool is_sgr(std::string_view esc) {
  if (esc.size() < 3 || esc[0] != '\x1B' || esc[1] != '[' || esc.back() != 'm') return false;
  for (size_t k = 2; k + 1 < esc.size(); ++k) {
    char c = esc[k];
    if (!((c >= '0' && c <= '9') || c == ';' || c == ':')) return false;
  }
  return true;
}

std::vector<Token> tokenize(std::string_view s) {
  std::vector<Token> out;
  out.reserve(s.size());
  int col = 0;
  for (size_t i = 0; i < s.size();) {
    if (s[i] == '\x1B') {
      size_t n = escape_len(s, i);
      out.push_back({Token::Kind::Escape, s.substr(i, n), col, 0});
      i += n;
      continue;
    }
    int cols = 0;
    size_t n = util::grapheme_len(s, i, cols);
    out.push_back({Token::Kind::Grapheme, s.substr(i, n), col, cols});
    col += cols;
    i += n;
  }
  return out;
}

std::string strip_ansi(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size();) {
    if (s[i] == '\x1B') { i += escape_len(s, i); continue; }
    out.push_back(s[i++]);
  }
  return out;
}

bool leaves_style_open(std::string_view s) {
  SgrState st;
  for (size_t i = 0; i < s.size();) {
    if (s[i] != '\x1B') { i++; continue; }
    size_t n = escape_len(s, i);
    st.apply(s.substr(i, n));
    i += n;
  }
  return st.active();
}

void SgrState::reset() {
  slots_.clear();
  replay_.clear();
}

void SgrState::set_slot(int key, std::string params) {
  for (auto& [k, v] : slots_) {
    if (k == key) { v = std::move(params); return; }
  }
  slots_.emplace_back(key, std::move(params));
}

void SgrState::clear_slot(int key) {
  std::erase_if(slots_, [key](const auto& s){ return s.first == key; });
}

namespace {

int leading_code(std::string_view p) {
  std::string_view head = p.substr(0, p.find(':'));
  int v = 0;
  if (!head.empty()) std::from_chars(head.data(), head.data() + head.size(), v);
  return v;
}

// Slot an attribute code sets; 0 when it sets none
int attr_slot(int c) {
  if (c >= 1 && c <= 9) return c == 6 ? 5 : c;
  if (c == 21) return 4;
  if (c == 53) return 53;
  return 0;
}

} // namespace

void SgrState::apply(std::string_view esc) {
  if (!is_sgr(esc)) return;
  std::string_view params = esc.substr(2, esc.size() - 3);

  std::vector<std::string_view> parts;
  size_t pos = 0;
  while (true) {
    size_t semi = params.find(';', pos);
    parts.push_back(params.substr(pos, semi == std::string_view::npos ? std::string_view::npos : semi - pos));
    if (semi == std::string_view::npos) break;
    pos = semi + 1;
  }

  for (size_t k = 0; k < parts.size(); ++k) {
    std::string_view p = parts[k];
    int c = leading_code(p);
    if (c == 4 && p.size() > 2 && p[1] == ':' && leading_code(p.substr(2)) == 0) c = 24;  // 4:0

    if (c == 0) slots_.clear();
    else if (int a = attr_slot(c)) set_slot(a, std::string(p));
    else if (c == 22) { clear_slot(1); clear_slot(2); }
    else if (c == 23 || c == 24 || c == 25 || c == 27 || c == 28 || c == 29) clear_slot(c - 20);
    else if (c == 55) clear_slot(53);
    else if ((c >= 30 && c <= 37) || (c >= 90 && c <= 97)) set_slot(38, std::string(p));
    else if ((c >= 40 && c <= 47) || (c >= 100 && c <= 107)) set_slot(48, std::string(p));
    else if (c == 39) clear_slot(38);
    else if (c == 49) clear_slot(48);
    else if (c == 59) clear_slot(58);
    else if (c == 38 || c == 48 || c == 58) {
      // Semicolon form carries its arguments as separate parameters: 5;n or 2;r;g;b
      size_t extra = 0;
      if (p.find(':') == std::string_view::npos && k + 1 < parts.size()) {
        int sel = leading_code(parts[k + 1]);
        extra = sel == 5 ? 2 : sel == 2 ? 4 : 0;
        extra = std::min(extra, parts.size() - 1 - k);
      }
      std::string color(p);
      for (size_t e = 1; e <= extra; ++e) { color += ';'; color += parts[k + e]; }
      set_slot(c, std::move(color));
      k += extra;
    }
  }

  replay_.clear();
  for (const auto& slot : slots_) {
    replay_ += "\x1B[";
    replay_ += slot.second;
    replay_ += 'm';
  }
}

} // namespace inkwell::text

#include "render/OutputBuffer.hpp"
#include "text/Ansi.hpp"
#include "text/Metrics.hpp"
#include <algorithm>
#include <cctype>

namespace inkwell::render {

std::string trim_end(std::string_view s) {
  size_t n = s.size();
  while (n > 0 && (s[n - 1] == ' ' || s[n - 1] == '\t')) --n;
  return std::string(s.substr(0, n));
}

bool has_visible_content(std::string_view s) {
  for (unsigned char c : text::strip_ansi(s)) {
    if (!std::isspace(c)) return true;
  }
  return false;
}

OutputBuffer::OutputBuffer(int width, int height)
    : width_(std::max(0, width)), lines_((size_t)std::max(0, height)) {}

std::string OutputBuffer::insert_at(const std::string& line, int x, std::string_view text) {
  int lw = text::visual_width(line);
  if (x >= lw) {
    std::string out = line;
    if (text::leaves_style_open(line)) out.append(text::kSgrReset);
    out.append((size_t)(x - lw), ' ');
    out.append(text);
    return out;
  }
  int tw = text::visual_width(text);
  std::string out = x > 0 ? text::slice_columns(line, 0, x) : std::string();
  out.append(text);
  if (x + tw < lw) {
    if (text::leaves_style_open(text)) out.append(text::kSgrReset);
    out += text::slice_columns(line, x + tw, lw);
  }
  return out;
}

void OutputBuffer::write(int x, int y, std::string_view text) {
  auto parts = text::split_lines(text);
  for (size_t i = 0; i < parts.size(); ++i) {
    int r = y + (int)i;
    if (r < 0 || r >= rows()) continue;
    std::string_view piece = parts[i];
    if (piece.empty()) continue;

    int sx = std::max(0, x);
    int avail = width_ - sx;
    if (avail <= 0) continue;
    int pw = text::visual_width(piece);
    int from = x < 0 ? -x : 0;
    int to = std::min(pw, from + avail);
    if (from >= to) continue;

    auto& row = lines_[(size_t)r];
    if (from == 0 && to == pw) row = insert_at(row, sx, piece);
    else row = insert_at(row, sx, text::slice_columns(piece, from, to));
  }
}

int OutputBuffer::last_content_row() const {
  for (int i = rows() - 1; i >= 0; --i) {
    if (has_visible_content(lines_[(size_t)i])) return i;
  }
  return -1;
}

std::string OutputBuffer::get(std::optional<int> max_height) const {
  int last = last_content_row();
  if (last < 0) return {};
  int end = last + 1;
  if (max_height && *max_height > 0) end = *max_height;
  std::string out;
  for (int i = 0; i < end; ++i) {
    if (i > 0) out += '\n';
    if (i < rows()) out += trim_end(lines_[(size_t)i]);
  }
  return out;
}

int OutputBuffer::height() const {
  return last_content_row() + 1;
}

} // namespace inkwell::render

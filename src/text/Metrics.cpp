#include "text/Metrics.hpp"
#include "text/Ansi.hpp"
#include <algorithm>
#include <mutex>
#include <unordered_map>

namespace inkwell::text {

int visual_width(std::string_view s) {
  int cols = 0;
  for (const auto& t : tokenize(s)) cols += t.width;
  return cols;
}

std::string slice_columns(std::string_view s, int start, int end) {
  if (start < 0) start = 0;
  if (end <= start) return {};
  auto toks = tokenize(s);
  SgrState st;
  std::string out;
  std::vector<std::string_view> held; // escapes inside the range, emitted with the next grapheme
  bool open = false;
  bool reached_end = true;

  auto flush_held = [&]{
    for (auto e : held) { st.apply(e); out.append(e); }
    held.clear();
  };

  for (const auto& t : toks) {
    if (t.kind == Token::Kind::Escape) {
      if (!open) st.apply(t.bytes);
      else held.push_back(t.bytes);
      continue;
    }
    int c0 = t.col, c1 = t.col + t.width;
    if (t.width == 0) {
      if (c0 < start) continue;
      if (c0 >= end) { reached_end = false; break; }
    } else {
      if (c1 <= start) continue;
      if (c0 >= end) { reached_end = false; break; }
    }
    if (!open) { out += st.replay(); open = true; }
    flush_held();
    if (c0 < start || c1 > end) {
      // Cut wide grapheme: keep the columns, drop the glyph
      int lo = std::max(c0, start), hi = std::min(c1, end);
      out.append((size_t)(hi - lo), ' ');
    } else {
      out.append(t.bytes);
    }
  }

  if (!open) return {};
  if (reached_end) flush_held();
  if (st.active()) out.append(kSgrReset);
  return out;
}

std::string slice_columns(std::string_view s, int start) {
  return slice_columns(s, start, visual_width(s));
}

std::vector<std::string_view> split_lines(std::string_view s) {
  std::vector<std::string_view> lines;
  size_t pos = 0;
  while (true) {
    size_t nl = s.find('\n', pos);
    if (nl == std::string_view::npos) { lines.push_back(s.substr(pos)); break; }
    lines.push_back(s.substr(pos, nl - pos));
    pos = nl + 1;
  }
  return lines;
}

namespace {

struct Span { int a; int b; };

void wrap_line(std::string_view line, int max_width, bool hard, std::vector<std::string>& out) {
  auto toks = tokenize(line);
  std::vector<Span> words;
  std::vector<int> ends; // grapheme end columns, for hard breaks
  int ws = 0, col = 0;
  for (const auto& t : toks) {
    if (t.kind == Token::Kind::Escape) continue;
    col = t.col + t.width;
    if (t.bytes == " ") {
      words.push_back({ws, t.col});
      ws = col;
      continue;
    }
    if (t.width > 0) ends.push_back(col);
  }
  words.push_back({ws, std::max(ws, col)});

  size_t produced = 0;
  int la = -1, lb = -1;
  auto flush = [&]{
    out.push_back(slice_columns(line, la, lb));
    ++produced;
    la = lb = -1;
  };
  auto chop = [&](Span w){
    int at = w.a;
    while (w.b - at > max_width) {
      int cut = -1;
      for (int e : ends) {
        if (e <= at) continue;
        if (e - at > max_width) { if (cut < 0) cut = e; break; }
        cut = e;
      }
      if (cut < 0 || cut >= w.b) break;
      out.push_back(slice_columns(line, at, cut));
      ++produced;
      at = cut;
    }
    la = at; lb = w.b;
  };

  for (const auto& w : words) {
    int ww = w.b - w.a;
    if (la >= 0 && lb == la) la = -1; // drop a line made only of spaces
    if (la < 0) {
      if (hard && ww > max_width) chop(w);
      else { la = w.a; lb = w.b; }
      continue;
    }
    if (w.b - la <= max_width) { lb = w.b; continue; }
    flush();
    if (hard && ww > max_width) chop(w);
    else { la = w.a; lb = w.b; }
  }
  if (la >= 0 && (lb > la || produced == 0)) flush();
}

} // namespace

std::vector<std::string> wrap(std::string_view s, int max_width, WrapOptions opts) {
  std::vector<std::string> out;
  for (auto line : split_lines(s)) {
    if (max_width <= 0 || visual_width(line) <= max_width) {
      out.emplace_back(line);
      continue;
    }
    wrap_line(line, max_width, opts.hard, out);
  }
  return out;
}

std::string wrap_text(std::string_view s, int max_width, WrapOptions opts) {
  std::string joined;
  bool first = true;
  for (const auto& l : wrap(s, max_width, opts)) {
    if (!first) joined += '\n';
    joined += l;
    first = false;
  }
  return joined;
}

std::string truncate(std::string_view s, int max_width, TruncateAnchor anchor) {
  int w = visual_width(s);
  if (w <= max_width) return std::string(s);
  int avail = max_width - 1;
  if (avail <= 0) return std::string(kEllipsis);
  switch (anchor) {
    case TruncateAnchor::End:
      return slice_columns(s, 0, avail) + std::string(kEllipsis);
    case TruncateAnchor::Start:
      return std::string(kEllipsis) + slice_columns(s, w - avail, w);
    case TruncateAnchor::Middle: {
      int head = avail / 2;
      return slice_columns(s, 0, head) + std::string(kEllipsis) + slice_columns(s, w - (avail - head), w);
    }
  }
  return std::string(s);
}

namespace {
std::mutex g_measure_mtx;
std::unordered_map<std::string, TextSize> g_measure_cache;
constexpr size_t kMeasureCacheMax = 4096;
}

TextSize measure_text(const std::string& s) {
  if (s.empty()) return {};
  {
    std::lock_guard<std::mutex> lk(g_measure_mtx);
    auto it = g_measure_cache.find(s);
    if (it != g_measure_cache.end()) return it->second;
  }
  TextSize sz{};
  for (auto line : split_lines(s)) {
    sz.width = std::max(sz.width, visual_width(line));
    sz.height += 1;
  }
  std::lock_guard<std::mutex> lk(g_measure_mtx);
  if (g_measure_cache.size() >= kMeasureCacheMax) g_measure_cache.clear();
  g_measure_cache.emplace(s, sz);
  return sz;
}

int widest_line(const std::string& s) {
  return measure_text(s).width;
}

void clear_measure_cache() {
  std::lock_guard<std::mutex> lk(g_measure_mtx);
  g_measure_cache.clear();
}

size_t measure_cache_size() {
  std::lock_guard<std::mutex> lk(g_measure_mtx);
  return g_measure_cache.size();
}

TextSize measure_wrapped(std::string_view s, int max_width) {
  if (s.empty()) return {};
  return measure_text(wrap_text(s, max_width, {.hard = true}));
}

} // namespace inkwell::text

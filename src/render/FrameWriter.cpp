#include "render/FrameWriter.hpp"
#include "text/Metrics.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <cstdio>

namespace inkwell::render {

namespace {

std::vector<std::string> lines_of(const model::Frame& frame) {
  std::vector<std::string> out;
  if (frame.empty()) return out;
  for (auto l : text::split_lines(frame.text)) out.emplace_back(l);
  return out;
}

// Cursor rests on the last row of a region `rows` tall; go to its first
// column and wipe everything below.
std::string erase_block(int rows) {
  if (rows <= 0) return {};
  std::string out = ui::cursor_up(rows - 1);
  out += '\r';
  out += ui::kEraseDown;
  return out;
}

} // namespace

FrameWriter::FrameWriter(IOutputSink& sink, WriterOptions opts)
    : sink_(sink), opts_(opts) {}

bool FrameWriter::emit(const std::string& bytes) {
  if (bytes.empty() || broken_) return false;
  if (!sink_.write(bytes)) {
    broken_ = true;
    std::fprintf(stderr, "inkwell: FrameWriter: write to %s failed, output suppressed\n", sink_.name());
    return false;
  }
  return true;
}

void FrameWriter::begin() {
  if (began_) return;
  began_ = true;
  if (!sink_.is_terminal() || opts_.debug) return;
  std::string out;
  if (opts_.full_screen) {
    out += ui::kAltScreenOn;
    out += ui::kClearScreen;
    out += ui::kCursorHome;
    ui::g_alt_in_use.store(true);
  }
  if (!opts_.show_cursor) {
    out += ui::kHideCursor;
    ui::g_cursor_hidden.store(true);
  }
  emit(out);
}

void FrameWriter::end() {
  if (!began_) return;
  began_ = false;
  if (!sink_.is_terminal() || opts_.debug) return;
  std::string out;
  if (!opts_.show_cursor) {
    out += ui::kShowCursor;
    ui::g_cursor_hidden.store(false);
  }
  if (opts_.full_screen) {
    out += ui::kAltScreenOff;
    ui::g_alt_in_use.store(false);
  }
  emit(out);
}

int FrameWriter::erase_rows() const {
  return invalidated_ ? std::max(painted_, max_height_) : painted_;
}

void FrameWriter::remember(const model::Frame& frame, std::vector<std::string> lines, int painted) {
  prev_ = frame;
  prev_lines_ = std::move(lines);
  painted_ = painted;
  max_height_ = std::max(max_height_, painted);
  first_ = false;
  invalidated_ = false;
}

std::string FrameWriter::patch_lines(const std::vector<std::string>& next) const {
  int prev_n = (int)prev_lines_.size();
  int next_n = (int)next.size();
  if (next_n == 0) return erase_block(prev_n);

  int start = 0;
  while (start < prev_n && start < next_n && prev_lines_[(size_t)start] == next[(size_t)start]) ++start;

  std::string out;
  if (start >= prev_n) {
    // previous frame is a prefix: continue below it
    for (int i = start; i < next_n; ++i) { out += '\n'; out += next[(size_t)i]; }
    return out;
  }
  // keep at least the last line so the cursor ends on the frame
  start = std::min(start, next_n - 1);
  out += ui::cursor_up(prev_n - 1 - start);
  out += '\r';
  out += ui::kEraseDown;
  for (int i = start; i < next_n; ++i) {
    if (i > start) out += '\n';
    out += next[(size_t)i];
  }
  return out;
}

std::string FrameWriter::paint_full_screen(const model::Frame& frame,
                                           const std::vector<model::Frame>& statics,
                                           int& painted) const {
  std::vector<std::string_view> rows;
  for (const auto& s : statics)
    for (auto l : text::split_lines(s.text)) rows.push_back(l);
  if (!frame.empty())
    for (auto l : text::split_lines(frame.text)) rows.push_back(l);

  std::string out(ui::kCursorHome);
  for (size_t i = 0; i < rows.size(); ++i) {
    if (i > 0) out += '\n';
    out += rows[i];
    out += ui::kClearEol;
  }
  painted = (int)rows.size();
  if (erase_rows() > painted) out += ui::kEraseDown;
  return out;
}

bool FrameWriter::commit(const model::Frame& frame, StaticLog& statics) {
  bool pending_static = statics.has_pending();
  if (!first_ && !invalidated_ && !pending_static && frame == prev_) return false;

  auto pending = statics.pending();
  auto next = lines_of(frame);
  std::string out;

  if (opts_.debug) {
    for (const auto& s : pending) { out += s.text; out += '\n'; }
    if (!frame.empty()) { out += frame.text; out += '\n'; }
    statics.mark_flushed();
    remember(frame, std::move(next), frame.line_count);
    return emit(out);
  }

  if (opts_.full_screen) {
    int painted = 0;
    out = paint_full_screen(frame, pending, painted);
    statics.mark_flushed();
    remember(frame, std::move(next), painted);
    return emit(out);
  }

  int rows = first_ ? 0 : erase_rows();
  if (pending_static) {
    out += erase_block(rows);
    for (const auto& s : pending) { out += s.text; out += '\n'; }
    statics.mark_flushed();
    out += frame.text;
    // Rows above the new live frame now hold scrollback
    max_height_ = 0;
  } else if (opts_.incremental && !first_ && !invalidated_ && painted_ > 0) {
    out += patch_lines(next);
  } else {
    out += erase_block(rows);
    out += frame.text;
  }
  remember(frame, std::move(next), frame.line_count);
  return emit(out);
}

void FrameWriter::clear() {
  if (opts_.full_screen) {
    std::string out(ui::kCursorHome);
    out += ui::kEraseDown;
    emit(out);
  } else if (!opts_.debug) {
    emit(ui::erase_lines(erase_rows()));
  }
  prev_ = {};
  prev_lines_.clear();
  painted_ = 0;
  max_height_ = 0;
  invalidated_ = false;
}

void FrameWriter::invalidate() {
  invalidated_ = true;
}

void FrameWriter::done() {
  if (!opts_.debug && !opts_.full_screen && painted_ > 0) emit("\n");
  prev_ = {};
  prev_lines_.clear();
  painted_ = 0;
  max_height_ = 0;
  first_ = true;
  invalidated_ = false;
}

} // namespace inkwell::render

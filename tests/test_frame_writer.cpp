#include "minitest.hpp"
#include "render/FrameWriter.hpp"
#include <string>

using inkwell::model::Frame;
using inkwell::render::FrameWriter;
using inkwell::render::MemorySink;
using inkwell::render::StaticLog;
using inkwell::render::WriterOptions;

namespace {
Frame F(const char* s) { return Frame::from_text(s); }
}

TEST(writer_first_frame_verbatim) {
  MemorySink sink;
  StaticLog log;
  FrameWriter w(sink);
  ASSERT_TRUE(w.commit(F("a\nb"), log));
  ASSERT_EQ(sink.take(), "a\nb");
  ASSERT_EQ(w.height(), 2);
}

TEST(writer_identical_frame_writes_nothing) {
  MemorySink sink;
  StaticLog log;
  FrameWriter w(sink);
  w.commit(F("a\nb"), log);
  sink.take();
  ASSERT_FALSE(w.commit(F("a\nb"), log));
  ASSERT_EQ(sink.data(), "");
}

TEST(writer_erases_previous_frame) {
  MemorySink sink;
  StaticLog log;
  FrameWriter w(sink);
  w.commit(F("a\nb"), log);
  sink.take();
  w.commit(F("a\nc"), log);
  ASSERT_EQ(sink.take(), "\x1B[1A\r\x1B[Ja\nc");
  w.commit(F("y"), log);
  ASSERT_EQ(sink.take(), "\x1B[1A\r\x1B[Jy");
  w.commit(F("z"), log);
  ASSERT_EQ(sink.take(), "\r\x1B[Jz");
  ASSERT_EQ(w.max_height(), 2);
}

TEST(writer_statics_go_above_frame) {
  MemorySink sink;
  StaticLog log;
  FrameWriter w(sink);
  w.commit(F("live"), log);
  sink.take();
  log.append_text("log1");
  ASSERT_TRUE(w.commit(F("live"), log));
  ASSERT_EQ(sink.take(), "\r\x1B[Jlog1\nlive");
  ASSERT_FALSE(log.has_pending());
  w.commit(F("live2"), log);
  ASSERT_EQ(sink.take(), "\r\x1B[Jlive2");
}

TEST(writer_statics_on_first_commit) {
  MemorySink sink;
  StaticLog log;
  FrameWriter w(sink);
  log.append_text("log");
  w.commit(F("live"), log);
  ASSERT_EQ(sink.take(), "log\nlive");
}

TEST(writer_broken_sink_suppresses_output) {
  MemorySink sink(true, 80, 1);
  StaticLog log;
  FrameWriter w(sink);
  ASSERT_TRUE(w.commit(F("a"), log));
  ASSERT_FALSE(w.broken());
  ASSERT_FALSE(w.commit(F("b"), log));
  ASSERT_TRUE(w.broken());
  ASSERT_FALSE(w.commit(F("c"), log));
  ASSERT_EQ(sink.data(), "a");
  ASSERT_EQ(sink.writes(), 1);
}

TEST(writer_incremental_rewrites_from_first_change) {
  MemorySink sink;
  StaticLog log;
  FrameWriter w(sink, WriterOptions{.incremental = true});
  w.commit(F("a\nb\nc"), log);
  sink.take();
  w.commit(F("a\nB\nc"), log);
  ASSERT_EQ(sink.take(), "\x1B[1A\r\x1B[JB\nc");
  w.commit(F("a\nB\nc\nd"), log);
  ASSERT_EQ(sink.take(), "\nd");
  w.commit(F("a\nB"), log);
  ASSERT_EQ(sink.take(), "\x1B[2A\r\x1B[JB");
}

TEST(writer_full_screen_repaints_from_home) {
  MemorySink sink;
  StaticLog log;
  FrameWriter w(sink, WriterOptions{.full_screen = true});
  w.commit(F("a\nb"), log);
  ASSERT_EQ(sink.take(), "\x1B[Ha\x1B[K\nb\x1B[K");
  w.commit(F("c"), log);
  ASSERT_EQ(sink.take(), "\x1B[Hc\x1B[K\x1B[J");
}

TEST(writer_debug_appends_frames) {
  MemorySink sink;
  StaticLog log;
  FrameWriter w(sink, WriterOptions{.debug = true});
  w.commit(F("a"), log);
  ASSERT_EQ(sink.take(), "a\n");
  log.append_text("s");
  w.commit(F("b"), log);
  ASSERT_EQ(sink.take(), "s\nb\n");
}

TEST(writer_invalidate_forces_rewrite) {
  MemorySink sink;
  StaticLog log;
  FrameWriter w(sink);
  w.commit(F("a\nb"), log);
  sink.take();
  w.invalidate();
  ASSERT_TRUE(w.commit(F("a\nb"), log));
  ASSERT_EQ(sink.take(), "\x1B[1A\r\x1B[Ja\nb");
  w.invalidate();
  w.commit(F("x"), log);
  ASSERT_EQ(sink.take(), "\x1B[1A\r\x1B[Jx");
}

TEST(writer_begin_end_cursor_and_alt_screen) {
  MemorySink sink;
  FrameWriter w(sink);
  w.begin();
  ASSERT_EQ(sink.take(), "\x1B[?25l");
  w.end();
  ASSERT_EQ(sink.take(), "\x1B[?25h");

  MemorySink fs_sink;
  FrameWriter fs(fs_sink, WriterOptions{.full_screen = true});
  fs.begin();
  ASSERT_EQ(fs_sink.take(), "\x1B[?1049h\x1B[2J\x1B[H\x1B[?25l");
  fs.end();
  ASSERT_EQ(fs_sink.take(), "\x1B[?25h\x1B[?1049l");

  MemorySink pipe(false);
  FrameWriter p(pipe, WriterOptions{.full_screen = true});
  p.begin();
  p.end();
  ASSERT_EQ(pipe.data(), "");
}

TEST(writer_done_moves_below_frame) {
  MemorySink sink;
  StaticLog log;
  FrameWriter w(sink);
  w.commit(F("a"), log);
  sink.take();
  w.done();
  ASSERT_EQ(sink.take(), "\n");
  w.commit(F("a"), log);
  ASSERT_EQ(sink.take(), "a");
}

TEST(writer_clear_erases_lines) {
  MemorySink sink;
  StaticLog log;
  FrameWriter w(sink);
  w.commit(F("a\nb\nc"), log);
  sink.take();
  w.clear();
  ASSERT_EQ(sink.take(), "\x1B[2K\x1B[1A\x1B[2K\x1B[1A\x1B[2K\r");
  ASSERT_EQ(w.height(), 0);
  w.commit(F("n"), log);
  ASSERT_EQ(sink.take(), "n");
}

TEST(writer_invalidate_after_static_keeps_scrollback) {
  MemorySink sink;
  StaticLog log;
  FrameWriter w(sink);
  w.commit(F("a\nb\nc"), log);
  log.append_text("STATIC");
  w.commit(F("L"), log);
  ASSERT_EQ(sink.take(), "a\nb\nc\x1B[2A\r\x1B[JSTATIC\nL");
  ASSERT_EQ(w.max_height(), 1);
  w.invalidate();
  w.commit(F("L"), log);
  ASSERT_EQ(sink.take(), "\r\x1B[JL");
}

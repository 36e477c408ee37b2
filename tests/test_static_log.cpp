#include "minitest.hpp"
#include "render/StaticLog.hpp"
#include <string>

using inkwell::model::Frame;
using inkwell::render::StaticLog;

TEST(static_log_ignores_empty_frames) {
  StaticLog log;
  log.append(Frame{});
  log.append_text("");
  ASSERT_EQ(log.size(), (size_t)0);
  ASSERT_FALSE(log.has_pending());
}

TEST(static_log_pending_and_flush) {
  StaticLog log;
  log.append_text("one");
  log.append(Frame::from_text("two\nlines"));
  ASSERT_TRUE(log.has_pending());
  auto p = log.pending();
  ASSERT_EQ(p.size(), (size_t)2);
  ASSERT_EQ(p[1].line_count, 2);
  log.mark_flushed();
  ASSERT_FALSE(log.has_pending());
  ASSERT_TRUE(log.pending().empty());

  log.append_text("three");
  p = log.pending();
  ASSERT_EQ(p.size(), (size_t)1);
  ASSERT_EQ(p[0].text, "three");
  ASSERT_EQ(log.text(), "one\ntwo\nlines\nthree");
}

TEST(static_log_clear) {
  StaticLog log;
  log.append_text("x");
  log.mark_flushed();
  log.clear();
  ASSERT_EQ(log.size(), (size_t)0);
  log.append_text("y");
  ASSERT_EQ(log.pending().size(), (size_t)1);
  ASSERT_EQ(log.text(), "y");
}

#include "minitest.hpp"
#include "render/OutputBuffer.hpp"
#include "text/Metrics.hpp"
#include <string>

using inkwell::render::OutputBuffer;

TEST(buffer_write_at_offset) {
  OutputBuffer buf(10, 1);
  buf.write(2, 0, "X");
  ASSERT_EQ(buf.get(), "  X");
  ASSERT_EQ(buf.height(), 1);
}

TEST(buffer_get_pads_to_max_height) {
  OutputBuffer buf(10, 4);
  buf.write(0, 1, "mid");
  ASSERT_EQ(buf.get(), "\nmid");
  ASSERT_EQ(buf.get(4), "\nmid\n\n");
  ASSERT_EQ(buf.height(), 2);
}

TEST(buffer_blank_canvas_is_empty) {
  OutputBuffer buf(10, 3);
  ASSERT_EQ(buf.get(), "");
  ASSERT_EQ(buf.get(3), "");
  ASSERT_EQ(buf.height(), 0);
  // a background alone is not content
  buf.write(0, 0, "\x1B[44m   \x1B[49m");
  ASSERT_EQ(buf.get(), "");
}

TEST(buffer_overwrite_splices_row) {
  OutputBuffer buf(10, 1);
  buf.write(0, 0, "abcdef");
  buf.write(2, 0, "XY");
  ASSERT_EQ(buf.get(), "abXYef");
}

TEST(buffer_overwrite_keeps_styles) {
  OutputBuffer buf(20, 1);
  buf.write(0, 0, "\x1B[31mred text\x1B[39m");
  buf.write(4, 0, "X");
  ASSERT_EQ(buf.get(), "\x1B[31mred \x1B[0mX\x1B[31mext\x1B[39m");
}

TEST(buffer_overwrite_cuts_wide_glyph) {
  OutputBuffer buf(10, 1);
  buf.write(0, 0, "日本");
  buf.write(1, 0, "x");
  ASSERT_EQ(buf.get(), " x本");
}

TEST(buffer_rows_outside_are_dropped) {
  OutputBuffer buf(5, 2);
  buf.write(0, -1, "a\nb\nc\nd");
  ASSERT_EQ(buf.get(), "b\nc");
}

TEST(buffer_columns_are_clipped) {
  OutputBuffer right(5, 1);
  right.write(3, 0, "abcd");
  ASSERT_EQ(right.get(), "   ab");

  OutputBuffer left(4, 1);
  left.write(-2, 0, "abcdef");
  ASSERT_EQ(left.get(), "cdef");

  OutputBuffer off(4, 1);
  off.write(4, 0, "zz");
  off.write(-3, 0, "ab");
  ASSERT_EQ(off.get(), "");
}

TEST(buffer_empty_lines_leave_rows_alone) {
  OutputBuffer buf(5, 3);
  buf.write(0, 1, "zz");
  buf.write(0, 0, "a\n\nb");
  ASSERT_EQ(buf.get(), "a\nzz\nb");
}

TEST(buffer_trailing_spaces_trimmed) {
  OutputBuffer buf(10, 2);
  buf.write(0, 0, "ab   ");
  buf.write(0, 1, "c \t");
  ASSERT_EQ(buf.get(), "ab\nc");
}

TEST(buffer_trim_end_keeps_escapes) {
  ASSERT_EQ(inkwell::render::trim_end("a  \x1B[0m"), "a  \x1B[0m");
  ASSERT_EQ(inkwell::render::trim_end("a \t "), "a");
  ASSERT_FALSE(inkwell::render::has_visible_content("\x1B[1m  \x1B[22m"));
  ASSERT_TRUE(inkwell::render::has_visible_content(" \x1B[1m.\x1B[22m"));
}

TEST(buffer_pinned_height_keeps_leading_blank_rows) {
  OutputBuffer buf(10, 4);
  buf.write(0, 3, "x");
  ASSERT_EQ(buf.get(4), "\n\n\nx");
  ASSERT_EQ(buf.get(2), "\n");
}

TEST(buffer_append_closes_open_row_style) {
  OutputBuffer buf(20, 1);
  buf.write(0, 0, "\x1B[31mred");
  buf.write(3, 0, "plain");
  ASSERT_EQ(buf.get(), "\x1B[31mred\x1B[0mplain");
}

TEST(buffer_repeated_splices_stay_compact) {
  std::string row = "\x1B[1m";
  for (int i = 0; i < 200; ++i) {
    row += "\x1B[3";
    row += (char)('0' + i % 8);
    row += "mx";
  }
  row += "\x1B[0m";
  OutputBuffer buf(200, 1);
  buf.write(0, 0, row);
  size_t before = buf.row(0).size();
  for (int i = 0; i < 50; ++i) buf.write(i * 4, 0, "Y");
  ASSERT_EQ(inkwell::text::visual_width(buf.row(0)), 200);
  // each splice adds a reset and a replay of the two open slots, not history
  ASSERT_TRUE(buf.row(0).size() < before + 50 * 20);
}

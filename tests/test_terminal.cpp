#include "minitest.hpp"
#include "ui/Terminal.hpp"
#include <string>

using namespace inkwell::ui;

TEST(terminal_cursor_up) {
  ASSERT_EQ(cursor_up(0), "");
  ASSERT_EQ(cursor_up(-2), "");
  ASSERT_EQ(cursor_up(3), "\x1B[3A");
}

TEST(terminal_erase_lines) {
  ASSERT_EQ(erase_lines(0), "");
  ASSERT_EQ(erase_lines(1), "\x1B[2K\r");
  ASSERT_EQ(erase_lines(3), "\x1B[2K\x1B[1A\x1B[2K\x1B[1A\x1B[2K\r");
}

TEST(terminal_sgr_builders) {
  ASSERT_EQ(sgr("1"), "\x1B[1m");
  ASSERT_EQ(sgr_palette_idx(1), "\x1B[31m");
  ASSERT_EQ(sgr_palette_idx(9, true), "\x1B[101m");
  ASSERT_EQ(sgr_palette_idx(300), "\x1B[38;5;255m");
  ASSERT_EQ(sgr_truecolor(-5, 128, 999, true), "\x1B[48;2;0;128;255m");
}

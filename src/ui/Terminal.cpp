#include "ui/Terminal.hpp"
#include <unistd.h>
#include <termios.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace inkwell::ui {

std::atomic<bool> g_stop{false};
std::atomic<bool> g_alt_in_use{false};
std::atomic<bool> g_cursor_hidden{false};

void best_effort_write(int fd, const char* buf, size_t len) {
  if (len == 0) return;
  if (::write(fd, buf, len) < 0) { /* ignore */ }
}

void restore_terminal_minimal() {
  // Async-signal-safe restoration: leave alt screen first, then cursor, then SGR
  if (g_alt_in_use.load()) best_effort_write(STDOUT_FILENO, kAltScreenOff.data(), kAltScreenOff.size());
  if (g_cursor_hidden.load()) best_effort_write(STDOUT_FILENO, kShowCursor.data(), kShowCursor.size());
  const char* reset = "\x1B[0m";
  best_effort_write(STDOUT_FILENO, reset, std::char_traits<char>::length(reset));
}

void on_sigint(int){ g_stop.store(true); }

void on_atexit_restore(){
  std::fflush(stdout);
  if (::isatty(STDOUT_FILENO) != 1) return;
  restore_terminal_minimal();
  // best-effort drain (not signal-safe; fine here)
  tcdrain(STDOUT_FILENO);
}

bool truecolor_capable() {
  const char* ct = std::getenv("COLORTERM");
  if (ct) {
    std::string s = ct;
    for (auto& c : s) c = std::tolower((unsigned char)c);
    if (s.find("truecolor") != std::string::npos || s.find("24bit") != std::string::npos) return true;
  }
  return false;
}

std::string cursor_up(int n) {
  if (n <= 0) return {};
  return "\x1B[" + std::to_string(n) + "A";
}

std::string erase_lines(int count) {
  std::string out;
  for (int i = 0; i < count; ++i) {
    out += kEraseLine;
    if (i < count - 1) out += cursor_up(1);
  }
  if (count > 0) out += '\r';
  return out;
}

std::string sgr(const char* code) {
  return std::string("\x1B[") + code + "m";
}

std::string sgr_code_int(int code) {
  return std::string("\x1B[") + std::to_string(code) + "m";
}

std::string sgr_palette_idx(int idx, bool background) {
  idx = std::clamp(idx, 0, 255);
  int base = background ? 40 : 30;
  if (idx <= 7) return sgr_code_int(base + idx);
  if (idx <= 15) return sgr_code_int(base + 60 + (idx - 8));
  // 256-color
  return std::string(background ? "\x1B[48;5;" : "\x1B[38;5;") + std::to_string(idx) + "m";
}

std::string sgr_truecolor(int r, int g, int b, bool background) {
  r = std::clamp(r,0,255); g = std::clamp(g,0,255); b = std::clamp(b,0,255);
  return std::string(background ? "\x1B[48;2;" : "\x1B[38;2;") + std::to_string(r) + ";" +
         std::to_string(g) + ";" + std::to_string(b) + "m";
}

} // namespace inkwell::ui

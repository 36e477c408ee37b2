#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace inkwell::ui {

// Terminal state management
extern std::atomic<bool> g_stop;
extern std::atomic<bool> g_alt_in_use;
extern std::atomic<bool> g_cursor_hidden;

void restore_terminal_minimal();
void on_sigint(int);
void on_atexit_restore();

// Terminal capability detection
[[nodiscard]] bool truecolor_capable();

// Control sequences
inline constexpr std::string_view kHideCursor = "\x1B[?25l";
inline constexpr std::string_view kShowCursor = "\x1B[?25h";
inline constexpr std::string_view kAltScreenOn = "\x1B[?1049h";
inline constexpr std::string_view kAltScreenOff = "\x1B[?1049l";
inline constexpr std::string_view kEraseDown = "\x1B[J";
inline constexpr std::string_view kClearEol = "\x1B[K";
inline constexpr std::string_view kEraseLine = "\x1B[2K";
inline constexpr std::string_view kClearScreen = "\x1B[2J";
inline constexpr std::string_view kCursorHome = "\x1B[H";

[[nodiscard]] std::string cursor_up(int n);
// Move up count-1 rows erasing each, leaving the cursor at column 0 of the
// topmost erased row
[[nodiscard]] std::string erase_lines(int count);

// SGR code generation. Whether color is wanted at all is decided by the caller.
[[nodiscard]] std::string sgr(const char* code);
[[nodiscard]] std::string sgr_code_int(int code);
[[nodiscard]] std::string sgr_palette_idx(int idx, bool background = false);
[[nodiscard]] std::string sgr_truecolor(int r, int g, int b, bool background = false);

// Best-effort terminal write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);

} // namespace inkwell::ui

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inkwell::render {

// Fixed-size canvas of complete styled lines. Text is composited into a row by
// splitting the existing row at visual columns, so escape sequences of both the
// row and the inserted text stay intact.
class OutputBuffer {
public:
  OutputBuffer(int width, int height);

  [[nodiscard]] int width() const { return width_; }
  [[nodiscard]] int rows() const { return (int)lines_.size(); }

  // Write each line of `text` at column x of rows y, y+1, ... Rows outside
  // the canvas are dropped, columns outside it are clipped.
  void write(int x, int y, std::string_view text);

  // Rows up to the last one with visible content, trailing spaces trimmed,
  // newline-joined. With max_height > 0 exactly that many rows are returned.
  [[nodiscard]] std::string get(std::optional<int> max_height = std::nullopt) const;

  // Last row with visible content + 1, 0 when blank
  [[nodiscard]] int height() const;

  [[nodiscard]] const std::string& row(int y) const { return lines_.at((size_t)y); }

  // Splice `text` into `line` at visual column x
  static std::string insert_at(const std::string& line, int x, std::string_view text);

private:
  [[nodiscard]] int last_content_row() const;

  int width_;
  std::vector<std::string> lines_;
};

// Trailing space/tab trim that leaves escape sequences alone
std::string trim_end(std::string_view s);

// True when the line has something besides whitespace once escapes are removed
[[nodiscard]] bool has_visible_content(std::string_view s);

} // namespace inkwell::render

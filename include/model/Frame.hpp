#pragma once

#include <algorithm>
#include <string>

namespace inkwell::model {

// One composited snapshot of the output grid
struct Frame {
  std::string text;
  int line_count{0};

  static Frame from_text(std::string s) {
    Frame f;
    f.line_count = s.empty() ? 0 : 1 + (int)std::count(s.begin(), s.end(), '\n');
    f.text = std::move(s);
    return f;
  }

  [[nodiscard]] bool empty() const { return line_count == 0; }
  bool operator==(const Frame& o) const { return text == o.text; }
};

} // namespace inkwell::model

#pragma once

#include "model/Frame.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace inkwell::render {

// Append-only log of content committed to the terminal scrollback. Entries are
// handed to the writer once and never diffed against live frames.
class StaticLog {
public:
  void append(model::Frame frame);
  void append_text(std::string text);

  // Entries not yet written to the terminal
  [[nodiscard]] std::vector<model::Frame> pending() const;
  [[nodiscard]] bool has_pending() const { return flushed_ < entries_.size(); }
  void mark_flushed() { flushed_ = entries_.size(); }

  // Everything committed so far, newline-joined
  [[nodiscard]] std::string text() const;

  [[nodiscard]] size_t size() const { return entries_.size(); }
  [[nodiscard]] const std::vector<model::Frame>& entries() const { return entries_; }

  void clear();

private:
  std::vector<model::Frame> entries_;
  size_t flushed_{0};
};

} // namespace inkwell::render

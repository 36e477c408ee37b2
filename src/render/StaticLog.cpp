#include "render/StaticLog.hpp"

namespace inkwell::render {

void StaticLog::append(model::Frame frame) {
  if (frame.empty()) return;
  entries_.push_back(std::move(frame));
}

void StaticLog::append_text(std::string text) {
  append(model::Frame::from_text(std::move(text)));
}

std::vector<model::Frame> StaticLog::pending() const {
  return std::vector<model::Frame>(entries_.begin() + (std::ptrdiff_t)flushed_, entries_.end());
}

std::string StaticLog::text() const {
  std::string out;
  for (size_t i = 0; i < entries_.size(); ++i) {
    if (i > 0) out += '\n';
    out += entries_[i].text;
  }
  return out;
}

void StaticLog::clear() {
  entries_.clear();
  flushed_ = 0;
}

} // namespace inkwell::render

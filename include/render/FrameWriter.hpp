#pragma once

#include "model/Frame.hpp"
#include "render/OutputSink.hpp"
#include "render/StaticLog.hpp"
#include <string>
#include <vector>

namespace inkwell::render {

struct WriterOptions {
  bool full_screen{false};   // alternate screen, repaint from home each frame
  bool incremental{false};   // rewrite only from the first changed line
  bool debug{false};         // append every frame, never erase
  bool show_cursor{false};
};

// Turns a sequence of frames into the terminal writes that move the screen
// from the previous frame to the next one. Owns no thread; callers serialize.
class FrameWriter {
public:
  explicit FrameWriter(IOutputSink& sink, WriterOptions opts = {});
  FrameWriter(const FrameWriter&) = delete;
  FrameWriter& operator=(const FrameWriter&) = delete;

  // Hide the cursor and enter the alternate screen as configured
  void begin();
  // Undo begin()
  void end();

  // Bring the screen from the previous frame to `frame`, flushing pending
  // static entries above it. Returns true when bytes were written.
  bool commit(const model::Frame& frame, StaticLog& statics);

  // Erase the live region
  void clear();
  // Next commit erases everything ever drawn and rewrites unconditionally
  void invalidate();
  // Leave the live region on screen, move below it and start over
  void done();

  [[nodiscard]] bool broken() const { return broken_; }
  [[nodiscard]] int height() const { return prev_.line_count; }
  [[nodiscard]] int max_height() const { return max_height_; }
  [[nodiscard]] const model::Frame& previous() const { return prev_; }
  [[nodiscard]] const WriterOptions& options() const { return opts_; }

private:
  bool emit(const std::string& bytes);
  [[nodiscard]] int erase_rows() const;
  [[nodiscard]] std::string patch_lines(const std::vector<std::string>& next) const;
  [[nodiscard]] std::string paint_full_screen(const model::Frame& frame,
                                              const std::vector<model::Frame>& statics,
                                              int& painted) const;
  void remember(const model::Frame& frame, std::vector<std::string> lines, int painted);

  IOutputSink& sink_;
  WriterOptions opts_;
  model::Frame prev_;
  std::vector<std::string> prev_lines_;
  int painted_{0};         // rows occupied on screen, statics included in full-screen
  int max_height_{0};
  bool first_{true};
  bool invalidated_{false};
  bool broken_{false};
  bool began_{false};
};

} // namespace inkwell::render

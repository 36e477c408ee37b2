#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include "model/Frame.hpp"
#include "model/Node.hpp"
#include "render/FrameWriter.hpp"
#include "render/OutputSink.hpp"
#include "render/StaticLog.hpp"
#include "render/TreeRenderer.hpp"
#include "ui/Config.hpp"

namespace inkwell::app {

struct RenderInfo {
  std::chrono::microseconds render_time{0};
  model::Frame frame;
  std::uint64_t render_count{0};
  bool wrote{false};
};

using RenderObserver = std::function<void(const RenderInfo&)>;

struct LoopOptions {
  int max_fps{60};
  render::WriterOptions writer{};
  render::RenderOptions render{};
  int columns{0};          // 0: follow the sink, 80 when it cannot tell
  bool threaded{true};     // false: caller drives tick()
  RenderObserver on_render;
};

// Options as configured for a sink
LoopOptions loop_options(const ui::RenderConfig& cfg, bool terminal);

// Everything that lives from start() to stop()
struct RenderSession {
  RenderSession(render::IOutputSink& sink, render::WriterOptions opts, int cols)
      : writer(sink, opts), columns(cols) {}

  render::FrameWriter writer;
  render::StaticLog statics;
  std::optional<model::Node> tree;   // retained tree, statics removed
  model::Frame frame;
  int columns;
  std::uint64_t render_count{0};
};

// Schedules renders of the latest tree and pushes frames to the sink. Updates
// coalesce in a single slot: the newest tree wins. Renders and terminal
// writes are serialized; update() is safe from any thread.
class RenderLoop {
public:
  explicit RenderLoop(render::IOutputSink& sink, LoopOptions opts = {});
  ~RenderLoop();
  RenderLoop(const RenderLoop&) = delete;
  RenderLoop& operator=(const RenderLoop&) = delete;

  void start();
  // Leave the final frame on screen (cursor moved below it) or erase it
  void stop(bool keep_output = true);

  void update(model::Node tree);
  // Render the pending tree now. Returns true when a render pass ran.
  bool tick();
  // Re-render the retained tree and rewrite it even if unchanged
  void force_update();
  void append_static(std::string text);
  void clear();
  void resize(int columns);

  [[nodiscard]] bool running() const;
  [[nodiscard]] model::Frame last_frame() const;
  [[nodiscard]] std::uint64_t render_count() const;
  [[nodiscard]] render::StaticLog static_log() const;
  [[nodiscard]] int columns() const;

private:
  void run(std::stop_token st);
  bool render_now(std::optional<model::Node> next, bool force);
  void notify(const RenderInfo& info) const;
  void wake();

  render::IOutputSink& sink_;
  LoopOptions opts_;
  render::TreeRenderer renderer_;

  std::mutex pending_mu_;
  std::condition_variable_any cv_;
  std::optional<model::Node> pending_;
  bool woken_{false};

  mutable std::mutex session_mu_;
  std::unique_ptr<RenderSession> session_;

  std::jthread thread_;
};

} // namespace inkwell::app

#include "app/RenderLoop.hpp"
#include <algorithm>
#include <cstdio>
#include <exception>

using namespace std::chrono;

namespace inkwell::app {

namespace {
constexpr auto kResizePoll = milliseconds(50);
constexpr int kFallbackColumns = 80;
}

LoopOptions loop_options(const ui::RenderConfig& cfg, bool terminal) {
  LoopOptions o;
  o.max_fps = std::clamp(cfg.max_fps, ui::kMinFps, ui::kMaxFps);
  o.columns = cfg.columns;
  o.writer.full_screen = cfg.full_screen;
  o.writer.incremental = cfg.incremental;
  o.writer.show_cursor = cfg.show_cursor;
  o.writer.debug = cfg.debug;
  o.render.colors = ui::color_level(cfg, terminal);
  return o;
}

RenderLoop::RenderLoop(render::IOutputSink& sink, LoopOptions opts)
    : sink_(sink), opts_(std::move(opts)), renderer_(opts_.render) {}

RenderLoop::~RenderLoop() { stop(); }

void RenderLoop::start() {
  {
    std::scoped_lock lk(session_mu_);
    if (session_) return;
    int cols = opts_.columns > 0 ? opts_.columns : sink_.columns();
    if (cols <= 0) cols = kFallbackColumns;
    session_ = std::make_unique<RenderSession>(sink_, opts_.writer, cols);
    session_->writer.begin();
  }
  if (opts_.threaded)
    thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void RenderLoop::stop(bool keep_output) {
  if (thread_.joinable()) {
    thread_.request_stop();
    // From the render observer the scheduler is this thread; it exits after
    // the current pass and is joined by a later stop() or the destructor.
    if (std::this_thread::get_id() != thread_.get_id()) thread_.join();
  }
  tick();
  std::scoped_lock lk(session_mu_);
  if (!session_) return;
  if (keep_output) session_->writer.done();
  else session_->writer.clear();
  session_->writer.end();
  session_.reset();
}

void RenderLoop::wake() {
  {
    std::scoped_lock lk(pending_mu_);
    woken_ = true;
  }
  cv_.notify_one();
}

void RenderLoop::update(model::Node tree) {
  {
    std::scoped_lock lk(pending_mu_);
    pending_ = std::move(tree);
    woken_ = true;
  }
  cv_.notify_one();
}

bool RenderLoop::tick() {
  std::optional<model::Node> next;
  {
    std::scoped_lock lk(pending_mu_);
    next.swap(pending_);
    woken_ = false;
  }
  return render_now(std::move(next), false);
}

void RenderLoop::force_update() {
  std::optional<model::Node> next;
  {
    std::scoped_lock lk(pending_mu_);
    next.swap(pending_);
  }
  render_now(std::move(next), true);
}

void RenderLoop::append_static(std::string text) {
  {
    std::scoped_lock lk(session_mu_);
    if (!session_) return;
    session_->statics.append_text(std::move(text));
  }
  wake();
}

void RenderLoop::clear() {
  std::scoped_lock lk(session_mu_);
  if (session_) session_->writer.clear();
}

void RenderLoop::resize(int columns) {
  if (columns <= 0) return;
  {
    std::scoped_lock lk(session_mu_);
    if (!session_ || session_->columns == columns) return;
    session_->columns = columns;
  }
  force_update();
}

bool RenderLoop::render_now(std::optional<model::Node> next, bool force) {
  RenderInfo info;
  {
    std::scoped_lock lk(session_mu_);
    if (!session_) return false;
    auto& s = *session_;
    if (!next && !force && !s.statics.has_pending()) return false;

    auto t0 = steady_clock::now();
    if (next) s.tree = std::move(*next);
    if (force) s.writer.invalidate();
    if (s.tree) {
      auto r = renderer_.render(*s.tree, s.columns);
      for (auto& f : r.statics) s.statics.append(std::move(f));
      s.frame = std::move(r.frame);
    }
    info.wrote = s.writer.commit(s.frame, s.statics);
    info.render_count = ++s.render_count;
    info.render_time = duration_cast<microseconds>(steady_clock::now() - t0);
    if (opts_.on_render) info.frame = s.frame;
  }
  notify(info);
  return true;
}

void RenderLoop::notify(const RenderInfo& info) const {
  if (!opts_.on_render) return;
  try {
    opts_.on_render(info);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "inkwell: RenderLoop: render observer failed: %s\n", e.what());
  } catch (...) {
    std::fprintf(stderr, "inkwell: RenderLoop: render observer failed: unknown exception\n");
  }
}

void RenderLoop::run(std::stop_token st) {
  const auto interval = microseconds(1000000 / std::max(1, opts_.max_fps));
  const bool follow_width = opts_.columns <= 0 && sink_.is_terminal();
  auto next_allowed = steady_clock::now();

  while (!st.stop_requested()) {
    {
      std::unique_lock lk(pending_mu_);
      cv_.wait_for(lk, st, kResizePoll, [this]{ return woken_; });
    }
    if (st.stop_requested()) break;

    if (follow_width) {
      int cols = sink_.columns();
      if (cols > 0 && cols != columns()) resize(cols);
    }

    // Throttle to max_fps; updates landing meanwhile replace the pending tree
    if (steady_clock::now() < next_allowed) {
      std::unique_lock lk(pending_mu_);
      cv_.wait_until(lk, st, next_allowed, []{ return false; });
      if (st.stop_requested()) break;
    }
    if (tick()) next_allowed = steady_clock::now() + interval;
  }
}

bool RenderLoop::running() const {
  std::scoped_lock lk(session_mu_);
  return session_ != nullptr;
}

model::Frame RenderLoop::last_frame() const {
  std::scoped_lock lk(session_mu_);
  return session_ ? session_->frame : model::Frame{};
}

std::uint64_t RenderLoop::render_count() const {
  std::scoped_lock lk(session_mu_);
  return session_ ? session_->render_count : 0;
}

render::StaticLog RenderLoop::static_log() const {
  std::scoped_lock lk(session_mu_);
  return session_ ? session_->statics : render::StaticLog{};
}

int RenderLoop::columns() const {
  std::scoped_lock lk(session_mu_);
  return session_ ? session_->columns : 0;
}

} // namespace inkwell::app

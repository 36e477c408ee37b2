#include "app/RenderLoop.hpp"
#include "model/Node.hpp"
#include "render/OutputSink.hpp"
#include "text/Metrics.hpp"
#include "ui/Config.hpp"
#include "ui/Terminal.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;
using inkwell::model::Node;
using inkwell::model::NodeKind;

namespace {

int parse_int(const char* s, int defv) {
  char* end = nullptr;
  long v = std::strtol(s, &end, 10);
  if (end == s || *end != '\0') return defv;
  return (int)v;
}

Node text_node(std::string text, int left, int top, int width, int height) {
  Node n;
  n.kind = NodeKind::Text;
  n.text = std::move(text);
  n.layout.left = left;
  n.layout.top = top;
  n.layout.width = width;
  n.layout.height = height;
  return n;
}

std::string progress_bar(int done, int total, int width) {
  int fill = total > 0 ? done * width / total : 0;
  std::string s;
  for (int i = 0; i < width; ++i) s += i < fill ? "█" : "░";
  return s;
}

// Lay out the live panel by hand: a rounded box holding a title, a bar and a
// status line, sized to the terminal width.
Node build_tree(int step, int steps, int cols, bool finished_row) {
  int w = std::clamp(cols, 24, 72);
  Node root;
  root.kind = NodeKind::Root;
  root.layout.width = cols;
  root.layout.height = 5;

  Node panel;
  panel.layout.width = w;
  panel.layout.height = 5;
  panel.layout.padding.left = 1;
  panel.layout.padding.right = 1;
  panel.box.border = inkwell::model::BorderStyle::Round;
  panel.box.border_color = "gray";

  int inner = w - 4;
  auto title = text_node("inkwell ▸ compositing demo", 2, 1, inner, 1);
  title.text_style.bold = true;
  title.text_style.color = "cyan";
  title.wrap = inkwell::model::TextWrap::TruncateEnd;

  std::string pct = std::to_string(steps > 0 ? step * 100 / steps : 100) + "%";
  int bar_w = std::max(4, inner - inkwell::text::visual_width(pct) - 1);
  auto bar = text_node(progress_bar(step, steps, bar_w) + " " + pct, 2, 2, inner, 1);
  bar.text_style.color = step >= steps ? "green" : "#5f87ff";

  auto status = text_node("step " + std::to_string(step) + "/" + std::to_string(steps) +
                              "  幅広い文字 and emoji 🚀 keep their columns",
                          2, 3, inner, 1);
  status.wrap = inkwell::model::TextWrap::TruncateMiddle;
  status.text_style.dim = true;

  panel.children = {std::move(title), std::move(bar), std::move(status)};
  root.children.push_back(std::move(panel));

  if (finished_row) {
    // Finalized rows leave the live region and go to scrollback
    auto done = text_node("✔ milestone at step " + std::to_string(step), 0, 0, cols, 1);
    done.is_static = true;
    done.text_style.color = "green";
    root.children.push_back(std::move(done));
  }
  return root;
}

} // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, inkwell::ui::on_sigint);
  std::signal(SIGTERM, inkwell::ui::on_sigint);
  std::signal(SIGPIPE, SIG_IGN);

  int steps = 40;
  int interval_ms = 100;
  bool clear_on_exit = false;
  bool show_stats = false;
  auto cfg = inkwell::ui::render_config();
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--steps" && i + 1 < argc) steps = std::max(1, parse_int(argv[++i], steps));
    else if (a == "--interval-ms" && i + 1 < argc) interval_ms = std::max(1, parse_int(argv[++i], interval_ms));
    else if (a == "--columns" && i + 1 < argc) cfg.columns = std::max(0, parse_int(argv[++i], 0));
    else if (a == "--full-screen") cfg.full_screen = true;
    else if (a == "--incremental") cfg.incremental = true;
    else if (a == "--debug") cfg.debug = true;
    else if (a == "--no-color") cfg.color = inkwell::ui::ColorMode::Never;
    else if (a == "--clear") clear_on_exit = true;
    else if (a == "--stats") show_stats = true;
    else if (a == "-h" || a == "--help") {
      std::cout << "Usage: inkwell-demo [--steps N] [--interval-ms MS] [--columns N]\n"
                   "                    [--full-screen] [--incremental] [--debug] [--no-color]\n"
                   "                    [--clear] [--stats]\n";
      std::cout << "Config: " << inkwell::ui::config_file_path() << " ([render], [color])\n";
      return 0;
    } else {
      std::fprintf(stderr, "inkwell-demo: unknown argument: %s\n", a.c_str());
      return 2;
    }
  }

  inkwell::render::FdSink sink(STDOUT_FILENO);
  auto opts = inkwell::app::loop_options(cfg, sink.is_terminal());
  std::uint64_t renders = 0;
  std::chrono::microseconds busy{0};
  opts.on_render = [&](const inkwell::app::RenderInfo& info) {
    ++renders;
    busy += info.render_time;
  };

  std::atexit(&inkwell::ui::on_atexit_restore);
  inkwell::app::RenderLoop loop(sink, opts);
  loop.start();

  for (int step = 0; step <= steps && !inkwell::ui::g_stop.load(); ++step) {
    int cols = loop.columns();
    bool milestone = step > 0 && step % 10 == 0;
    loop.update(build_tree(step, steps, cols, milestone));
    if (step > 0 && step % 7 == 0) loop.append_static("log: checkpoint " + std::to_string(step));
    std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
  }

  bool interrupted = inkwell::ui::g_stop.load();
  loop.stop(!clear_on_exit);

  if (show_stats) {
    std::fprintf(stderr, "inkwell-demo: %llu renders, %lld us rendering%s\n",
                 (unsigned long long)renders, (long long)busy.count(),
                 interrupted ? " (interrupted)" : "");
  }
  return interrupted ? 130 : 0;
}

#pragma once

#include "model/Frame.hpp"
#include "model/Node.hpp"
#include "render/OutputBuffer.hpp"
#include "ui/Style.hpp"
#include <vector>

namespace inkwell::render {

struct BoxChars {
  const char* top_left;
  const char* top;
  const char* top_right;
  const char* right;
  const char* bottom_right;
  const char* bottom;
  const char* bottom_left;
  const char* left;
};

// Glyphs for a border style; None falls back to Single
const BoxChars& box_chars(model::BorderStyle style);

struct RenderOptions {
  ui::ColorLevel colors{ui::ColorLevel::TrueColor};
};

struct RenderResult {
  model::Frame frame;
  std::vector<model::Frame> statics;  // in tree order
};

// Composites a solved layout tree into frames: backgrounds first, then
// borders, then text, children over parents.
class TreeRenderer {
public:
  explicit TreeRenderer(RenderOptions opts = {}) : opts_(opts) {}

  // Static subtrees are rendered on their own canvas and removed from `root`,
  // so later renders of the retained tree no longer contain them.
  RenderResult render(model::Node& root, int columns) const;

  // Render a subtree as if it were the root, at its own position
  [[nodiscard]] model::Frame render_subtree(const model::Node& node, int columns) const;

private:
  void extract_statics(model::Node& node, int ox, int columns, std::vector<model::Frame>& out) const;
  void paint(const model::Node& node, OutputBuffer& out, int ox, int oy) const;
  void paint_background(const model::Node& node, OutputBuffer& out, int x, int y) const;
  void paint_border(const model::Node& node, OutputBuffer& out, int x, int y) const;
  void paint_text(const model::Node& node, OutputBuffer& out, int x, int y) const;

  RenderOptions opts_;
};

} // namespace inkwell::render

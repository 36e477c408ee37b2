#include "render/TreeRenderer.hpp"
#include "text/Metrics.hpp"
#include <algorithm>
#include <string>

namespace inkwell::render {

namespace {

constexpr BoxChars kSingle{"┌", "─", "┐", "│", "┘", "─", "└", "│"};
constexpr BoxChars kDouble{"╔", "═", "╗", "║", "╝", "═", "╚", "║"};
constexpr BoxChars kRound{"╭", "─", "╮", "│", "╯", "─", "╰", "│"};
constexpr BoxChars kBold{"┏", "━", "┓", "┃", "┛", "━", "┗", "┃"};
constexpr BoxChars kSingleDouble{"╓", "─", "╖", "║", "╜", "─", "╙", "║"};
constexpr BoxChars kDoubleSingle{"╒", "═", "╕", "│", "╛", "═", "╘", "│"};
constexpr BoxChars kClassic{"+", "-", "+", "|", "+", "-", "+", "|"};

std::string repeat_str(const char* ch, int n) {
  std::string r;
  for (int i = 0; i < n; i++) r += ch;
  return r;
}

int canvas_rows(const model::Node& node) {
  int h = node.layout.top + node.layout.height;
  if (node.box.height) h = std::max(h, *node.box.height);
  return std::max(1, h);
}

const std::string& first_set(const std::string& a, const std::string& b) {
  return a.empty() ? b : a;
}

} // namespace

const BoxChars& box_chars(model::BorderStyle style) {
  switch (style) {
    case model::BorderStyle::Double: return kDouble;
    case model::BorderStyle::Round: return kRound;
    case model::BorderStyle::Bold: return kBold;
    case model::BorderStyle::SingleDouble: return kSingleDouble;
    case model::BorderStyle::DoubleSingle: return kDoubleSingle;
    case model::BorderStyle::Classic: return kClassic;
    case model::BorderStyle::None:
    case model::BorderStyle::Single: break;
  }
  return kSingle;
}

RenderResult TreeRenderer::render(model::Node& root, int columns) const {
  RenderResult r;
  extract_statics(root, root.layout.left, columns, r.statics);
  r.frame = render_subtree(root, columns);
  return r;
}

model::Frame TreeRenderer::render_subtree(const model::Node& node, int columns) const {
  OutputBuffer out(columns, canvas_rows(node));
  paint(node, out, 0, 0);
  std::optional<int> pin;
  if (node.box.height && *node.box.height > 0) pin = node.layout.top + *node.box.height;
  return model::Frame::from_text(out.get(pin));
}

void TreeRenderer::extract_statics(model::Node& node, int ox, int columns,
                                   std::vector<model::Frame>& out) const {
  auto& kids = node.children;
  for (auto it = kids.begin(); it != kids.end();) {
    if (it->is_static) {
      if (!it->box.hidden) {
        // Scrollback content starts on its own row; keep only the column offset
        OutputBuffer buf(columns, std::max(1, it->layout.height));
        paint(*it, buf, ox, -it->layout.top);
        auto frame = model::Frame::from_text(buf.get());
        if (!frame.empty()) out.push_back(std::move(frame));
      }
      it = kids.erase(it);
      continue;
    }
    extract_statics(*it, ox + it->layout.left, columns, out);
    ++it;
  }
}

void TreeRenderer::paint(const model::Node& node, OutputBuffer& out, int ox, int oy) const {
  if (node.box.hidden) return;
  int x = ox + node.layout.left;
  int y = oy + node.layout.top;

  paint_background(node, out, x, y);
  if (node.box.border != model::BorderStyle::None) paint_border(node, out, x, y);

  if (node.kind == model::NodeKind::Text) {
    paint_text(node, out, x, y);
    return;
  }
  for (const auto& child : node.children) paint(child, out, x, y);
}

void TreeRenderer::paint_background(const model::Node& node, OutputBuffer& out, int x, int y) const {
  if (node.box.background.empty() || node.layout.width <= 0) return;
  std::string line = ui::colorize(std::string((size_t)node.layout.width, ' '), node.box.background,
                                  ui::ColorTarget::Background, opts_.colors);
  for (int row = 0; row < node.layout.height; ++row) out.write(x, y + row, line);
}

void TreeRenderer::paint_border(const model::Node& node, OutputBuffer& out, int x, int y) const {
  const auto& b = node.box;
  const BoxChars& ch = box_chars(b.border);
  int w = node.layout.width;
  int h = node.layout.height;
  if (w <= 0 || h <= 0) return;

  model::TextStyle dim;
  dim.dim = true;
  auto paint_edge = [&](std::string s, const std::string& color) {
    if (!color.empty()) s = ui::colorize(s, color, ui::ColorTarget::Foreground, opts_.colors);
    if (b.border_dim) s = ui::apply_text_style(s, dim, opts_.colors);
    return s;
  };
  const std::string& top_color = first_set(b.border_top_color, b.border_color);
  const std::string& bottom_color = first_set(b.border_bottom_color, b.border_color);
  const std::string& left_color = first_set(b.border_left_color, b.border_color);
  const std::string& right_color = first_set(b.border_right_color, b.border_color);

  int inner = std::max(0, w - (b.border_left ? 1 : 0) - (b.border_right ? 1 : 0));
  if (b.border_top) {
    std::string s = (b.border_left ? ch.top_left : "") + repeat_str(ch.top, inner) +
                    (b.border_right ? ch.top_right : "");
    out.write(x, y, paint_edge(s, top_color));
  }
  int first = b.border_top ? 1 : 0;
  int last = h - (b.border_bottom ? 1 : 0);
  std::string left = paint_edge(ch.left, left_color);
  std::string right = paint_edge(ch.right, right_color);
  for (int row = first; row < last; ++row) {
    if (b.border_left) out.write(x, y + row, left);
    if (b.border_right) out.write(x + w - 1, y + row, right);
  }
  if (b.border_bottom && (h > 1 || !b.border_top)) {
    std::string s = (b.border_left ? ch.bottom_left : "") + repeat_str(ch.bottom, inner) +
                    (b.border_right ? ch.bottom_right : "");
    out.write(x, y + h - 1, paint_edge(s, bottom_color));
  }
}

void TreeRenderer::paint_text(const model::Node& node, OutputBuffer& out, int x, int y) const {
  if (node.text.empty()) return;
  const auto& b = node.box;
  bool bordered = b.border != model::BorderStyle::None;
  const auto& pad = node.layout.padding;
  int bl = bordered && b.border_left ? 1 : 0;
  int br = bordered && b.border_right ? 1 : 0;
  int bt = bordered && b.border_top ? 1 : 0;
  int avail = node.layout.width - pad.left - pad.right - bl - br;

  std::string body;
  if (node.wrap == model::TextWrap::Wrap) {
    body = text::wrap_text(node.text, avail, {.hard = true});
  } else {
    auto anchor = node.wrap == model::TextWrap::TruncateStart ? text::TruncateAnchor::Start
                : node.wrap == model::TextWrap::TruncateMiddle ? text::TruncateAnchor::Middle
                : text::TruncateAnchor::End;
    auto lines = text::split_lines(node.text);
    for (size_t i = 0; i < lines.size(); ++i) {
      if (i > 0) body += '\n';
      body += avail > 0 ? text::truncate(lines[i], avail, anchor) : std::string(lines[i]);
    }
  }
  out.write(x + pad.left + bl, y + pad.top + bt, ui::apply_text_style(body, node.text_style, opts_.colors));
}

} // namespace inkwell::render

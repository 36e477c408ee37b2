#pragma once

#include <optional>
#include <string>
#include <vector>

namespace inkwell::model {

// A node of the already-solved layout tree handed over by the layout engine.
// Positions are in character cells relative to the parent node.

enum class NodeKind { Root, Box, Text };

enum class BorderStyle { None, Single, Double, Round, Bold, SingleDouble, DoubleSingle, Classic };

enum class TextWrap { Wrap, TruncateEnd, TruncateMiddle, TruncateStart };

struct Edges {
  int top{0};
  int right{0};
  int bottom{0};
  int left{0};
};

struct Layout {
  int left{0};
  int top{0};
  int width{0};
  int height{0};
  Edges padding{};
};

// Colors are names ("red", "brightBlue"), "#rrggbb", "rgb(r,g,b)" or
// "ansi256(n)"; empty means unset.
struct TextStyle {
  std::string color;
  std::string background;
  bool bold{false};
  bool dim{false};
  bool italic{false};
  bool underline{false};
  bool strikethrough{false};
  bool inverse{false};
};

struct BoxStyle {
  BorderStyle border{BorderStyle::None};
  bool border_top{true};
  bool border_right{true};
  bool border_bottom{true};
  bool border_left{true};
  std::string border_color;
  std::string border_top_color;
  std::string border_right_color;
  std::string border_bottom_color;
  std::string border_left_color;
  bool border_dim{false};
  std::string background;
  bool hidden{false};            // display: none
  std::optional<int> height;     // explicit height reserves rows even when blank
};

struct Node {
  NodeKind kind{NodeKind::Box};
  Layout layout{};
  BoxStyle box{};
  TextStyle text_style{};
  TextWrap wrap{TextWrap::Wrap};
  std::string text;              // squashed text content of a Text node
  bool is_static{false};         // finalized output, emitted once above the live region
  std::vector<Node> children;
};

} // namespace inkwell::model

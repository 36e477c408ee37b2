#pragma once

#include "ui/Style.hpp"
#include <string>
#include <string_view>

namespace inkwell::util { class TomlReader; }

namespace inkwell::ui {

enum class ColorMode { Auto, Always, Never };

struct RenderConfig {
  int max_fps{60};
  bool full_screen{false};
  bool incremental{false};
  bool show_cursor{false};
  bool debug{false};
  int columns{0};               // 0: terminal width, 80 when not a terminal
  ColorMode color{ColorMode::Auto};
  std::string source;           // config file the values came from, if any
};

inline constexpr int kMinFps = 1;
inline constexpr int kMaxFps = 240;

// Process-wide configuration, resolved once
const RenderConfig& render_config();

// Resolve TOML -> env -> compiled default. An empty or unreadable path
// resolves from the environment alone.
RenderConfig load_render_config(const std::string& path);
RenderConfig resolve_render_config(const util::TomlReader& toml, bool have_toml);

// $INKWELL_CONFIG, else $XDG_CONFIG_HOME/inkwell/config.toml, else
// $HOME/.config/inkwell/config.toml
std::string config_file_path();

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);

[[nodiscard]] ColorMode parse_color_mode(std::string_view s, ColorMode defv);

// Color depth for output going to a terminal (or not), honoring NO_COLOR and
// FORCE_COLOR in auto mode
[[nodiscard]] ColorLevel color_level(const RenderConfig& cfg, bool terminal);

} // namespace inkwell::ui

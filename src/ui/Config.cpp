#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace inkwell::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("INKWELL_", 0) == 0) {
    alt = std::string("inkwell_") + n.substr(8);
  } else if (n.rfind("inkwell_", 0) == 0) {
    alt = std::string("INKWELL_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  char* end = nullptr;
  long r = std::strtol(v, &end, 10);
  if (end == v || *end != '\0') return defv;
  return (int)r;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* p = getenv_compat("INKWELL_CONFIG"); p && *p)
    return p;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/inkwell/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/inkwell/config.toml";
  return {};
}

ColorMode parse_color_mode(std::string_view s, ColorMode defv) {
  std::string v(s);
  for (auto& c : v) c = (char)std::tolower((unsigned char)c);
  if (v == "auto") return ColorMode::Auto;
  if (v == "always" || v == "on" || v == "true") return ColorMode::Always;
  if (v == "never" || v == "off" || v == "false") return ColorMode::Never;
  return defv;
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

RenderConfig resolve_render_config(const util::TomlReader& toml, bool have_toml) {
  RenderConfig c{};

  // --- [render] ---
  int fps = resolve_int(toml, have_toml, "render", "max_fps", "INKWELL_MAX_FPS", 60);
  c.max_fps = std::clamp(fps, kMinFps, kMaxFps);
  if (c.max_fps != fps)
    std::fprintf(stderr, "inkwell: Config: max_fps %d out of range, using %d\n", fps, c.max_fps);
  c.full_screen = resolve_bool(toml, have_toml, "render", "full_screen", "INKWELL_FULL_SCREEN", false);
  c.incremental = resolve_bool(toml, have_toml, "render", "incremental", "INKWELL_INCREMENTAL", false);
  c.show_cursor = resolve_bool(toml, have_toml, "render", "show_cursor", "INKWELL_SHOW_CURSOR", false);
  c.debug       = resolve_bool(toml, have_toml, "render", "debug",       "INKWELL_DEBUG", false);
  c.columns     = std::max(0, resolve_int(toml, have_toml, "render", "columns", "INKWELL_COLUMNS", 0));

  // --- [color] ---
  std::string mode = resolve_string(toml, have_toml, "color", "mode", "INKWELL_COLOR", "auto");
  c.color = parse_color_mode(mode, ColorMode::Auto);

  return c;
}

RenderConfig load_render_config(const std::string& path) {
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  auto c = resolve_render_config(toml, have_toml);
  if (have_toml) c.source = path;
  return c;
}

const RenderConfig& render_config() {
  static RenderConfig cfg = []{
    auto path = config_file_path();
    auto c = load_render_config(path);
    if (c.source.empty() && getenv_compat("INKWELL_CONFIG"))
      std::fprintf(stderr, "inkwell: Config: cannot read %s, using defaults\n", path.c_str());
    return c;
  }();
  return cfg;
}

ColorLevel color_level(const RenderConfig& cfg, bool terminal) {
  auto detected = [] { return truecolor_capable() ? ColorLevel::TrueColor : ColorLevel::Ansi256; };
  switch (cfg.color) {
    case ColorMode::Never: return ColorLevel::None;
    case ColorMode::Always: return detected();
    case ColorMode::Auto: break;
  }
  if (const char* nc = std::getenv("NO_COLOR"); nc && *nc) return ColorLevel::None;
  if (const char* fc = std::getenv("FORCE_COLOR"); fc) {
    std::string v = fc;
    if (v == "0" || v == "false") return ColorLevel::None;
    if (v == "1") return ColorLevel::Basic;
    if (v == "2") return ColorLevel::Ansi256;
    if (v == "3") return ColorLevel::TrueColor;
    return detected();
  }
  return terminal ? detected() : ColorLevel::None;
}

} // namespace inkwell::ui

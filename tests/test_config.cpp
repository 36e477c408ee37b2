#include "minitest.hpp"
#include "ui/Config.hpp"
#include "util/TomlReader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace inkwell::ui;

namespace {

// Sets or unsets variables for one test and puts the old values back
class EnvGuard {
public:
  ~EnvGuard() {
    for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
      if (it->second) ::setenv(it->first.c_str(), it->second->c_str(), 1);
      else ::unsetenv(it->first.c_str());
    }
  }
  void set(const char* name, const char* value) {
    remember(name);
    ::setenv(name, value, 1);
  }
  void unset(const char* name) {
    remember(name);
    ::unsetenv(name);
  }

private:
  void remember(const char* name) {
    const char* v = std::getenv(name);
    saved_.emplace_back(name, v ? std::optional<std::string>(v) : std::nullopt);
  }
  std::vector<std::pair<std::string, std::optional<std::string>>> saved_;
};

const char* kRenderVars[] = {
  "INKWELL_MAX_FPS", "INKWELL_FULL_SCREEN", "INKWELL_INCREMENTAL", "INKWELL_SHOW_CURSOR",
  "INKWELL_DEBUG", "INKWELL_COLUMNS", "INKWELL_COLOR",
  "inkwell_MAX_FPS", "inkwell_FULL_SCREEN", "inkwell_COLOR",
};

void clear_render_env(EnvGuard& g) {
  for (const char* v : kRenderVars) g.unset(v);
}

std::string write_config(const char* name, const std::string& body) {
  std::string path = std::string("/tmp/inkwell_test_config_") + name + ".toml";
  std::ofstream f(path);
  f << body;
  return path;
}

void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // namespace

TEST(config_getenv_compat_lowercase_prefix) {
  EnvGuard g;
  g.unset("INKWELL_ZZ_TEST");
  g.set("inkwell_ZZ_TEST", "7");
  ASSERT_EQ(std::string(getenv_compat("INKWELL_ZZ_TEST")), "7");
  g.set("INKWELL_ZZ_TEST", "8");
  ASSERT_EQ(std::string(getenv_compat("INKWELL_ZZ_TEST")), "8");
  g.unset("INKWELL_ZZ_NONE");
  g.unset("inkwell_ZZ_NONE");
  ASSERT_TRUE(getenv_compat("INKWELL_ZZ_NONE") == nullptr);
}

TEST(config_getenv_int_and_flags) {
  EnvGuard g;
  g.set("INKWELL_ZZ_INT", "12");
  ASSERT_EQ(getenv_int("INKWELL_ZZ_INT", 3), 12);
  g.set("INKWELL_ZZ_INT", "12x");
  ASSERT_EQ(getenv_int("INKWELL_ZZ_INT", 3), 3);
  g.unset("INKWELL_ZZ_INT");
  g.unset("inkwell_ZZ_INT");
  ASSERT_EQ(getenv_int("INKWELL_ZZ_INT", 3), 3);

  g.set("INKWELL_ZZ_FLAG", "no");
  ASSERT_FALSE(env_flag("INKWELL_ZZ_FLAG", true));
  g.set("INKWELL_ZZ_FLAG", "1");
  ASSERT_TRUE(env_flag("INKWELL_ZZ_FLAG", false));
  g.unset("INKWELL_ZZ_FLAG");
  g.unset("inkwell_ZZ_FLAG");
  ASSERT_TRUE(env_flag("INKWELL_ZZ_FLAG", true));
}

TEST(config_defaults_without_file) {
  EnvGuard g;
  clear_render_env(g);
  auto c = load_render_config("");
  ASSERT_EQ(c.max_fps, 60);
  ASSERT_FALSE(c.full_screen);
  ASSERT_FALSE(c.incremental);
  ASSERT_EQ(c.columns, 0);
  ASSERT_TRUE(c.color == ColorMode::Auto);
  ASSERT_TRUE(c.source.empty());
}

TEST(config_load_file_and_clamp) {
  EnvGuard g;
  clear_render_env(g);
  auto path = write_config("clamp",
    "[render]\n"
    "max_fps = 500\n"
    "full_screen = true\n"
    "columns = 100\n"
    "\n"
    "[color]\n"
    "mode = \"never\"\n");
  auto c = load_render_config(path);
  ASSERT_EQ(c.max_fps, kMaxFps);
  ASSERT_TRUE(c.full_screen);
  ASSERT_EQ(c.columns, 100);
  ASSERT_TRUE(c.color == ColorMode::Never);
  ASSERT_EQ(c.source, path);
  remove_file(path);
}

TEST(config_env_fallback_and_toml_precedence) {
  EnvGuard g;
  clear_render_env(g);
  g.set("INKWELL_MAX_FPS", "30");
  g.set("INKWELL_INCREMENTAL", "1");
  g.set("INKWELL_COLOR", "always");
  auto env_only = load_render_config("/tmp/inkwell_test_config_missing.toml");
  ASSERT_EQ(env_only.max_fps, 30);
  ASSERT_TRUE(env_only.incremental);
  ASSERT_TRUE(env_only.color == ColorMode::Always);
  ASSERT_TRUE(env_only.source.empty());

  inkwell::util::TomlReader toml;
  toml.load_string("[render]\nmax_fps = 15\n");
  auto c = resolve_render_config(toml, true);
  ASSERT_EQ(c.max_fps, 15);
  ASSERT_TRUE(c.incremental);

  g.set("INKWELL_MAX_FPS", "0");
  ASSERT_EQ(load_render_config("").max_fps, kMinFps);
}

TEST(config_file_path_resolution) {
  EnvGuard g;
  g.set("INKWELL_CONFIG", "/etc/inkwell.toml");
  ASSERT_EQ(config_file_path(), "/etc/inkwell.toml");
  g.unset("INKWELL_CONFIG");
  g.unset("inkwell_CONFIG");
  g.set("XDG_CONFIG_HOME", "/xdg");
  ASSERT_EQ(config_file_path(), "/xdg/inkwell/config.toml");
  g.unset("XDG_CONFIG_HOME");
  g.set("HOME", "/home/u");
  ASSERT_EQ(config_file_path(), "/home/u/.config/inkwell/config.toml");
}

TEST(config_color_mode_parsing) {
  ASSERT_TRUE(parse_color_mode("ALWAYS", ColorMode::Auto) == ColorMode::Always);
  ASSERT_TRUE(parse_color_mode("off", ColorMode::Auto) == ColorMode::Never);
  ASSERT_TRUE(parse_color_mode("auto", ColorMode::Never) == ColorMode::Auto);
  ASSERT_TRUE(parse_color_mode("sometimes", ColorMode::Never) == ColorMode::Never);
}

TEST(config_color_level_resolution) {
  EnvGuard g;
  g.unset("NO_COLOR");
  g.unset("FORCE_COLOR");
  g.set("COLORTERM", "truecolor");
  RenderConfig c;

  c.color = ColorMode::Never;
  ASSERT_TRUE(color_level(c, true) == ColorLevel::None);
  c.color = ColorMode::Always;
  ASSERT_TRUE(color_level(c, false) == ColorLevel::TrueColor);
  g.unset("COLORTERM");
  ASSERT_TRUE(color_level(c, false) == ColorLevel::Ansi256);

  c.color = ColorMode::Auto;
  ASSERT_TRUE(color_level(c, true) == ColorLevel::Ansi256);
  ASSERT_TRUE(color_level(c, false) == ColorLevel::None);
  g.set("FORCE_COLOR", "2");
  ASSERT_TRUE(color_level(c, false) == ColorLevel::Ansi256);
  g.set("FORCE_COLOR", "1");
  ASSERT_TRUE(color_level(c, false) == ColorLevel::Basic);
  g.set("FORCE_COLOR", "0");
  ASSERT_TRUE(color_level(c, true) == ColorLevel::None);
  g.unset("FORCE_COLOR");
  g.set("NO_COLOR", "1");
  ASSERT_TRUE(color_level(c, true) == ColorLevel::None);
}

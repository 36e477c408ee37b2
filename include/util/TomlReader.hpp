#pragma once

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace inkwell::util {

// Flat `[section] key = value` reader. Understands comments, basic and
// literal strings, integers and booleans. Arrays, inline tables and
// multi-line strings are not supported and read as raw text.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) { sections_.clear(); return false; }
    std::ostringstream buf;
    buf << in.rdbuf();
    load_string(buf.str());
    return true;
  }

  void load_string(std::string_view text) {
    std::istringstream in{std::string(text)};
    parse(in);
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    char* end = nullptr;
    long v = std::strtol(val.c_str(), &end, 10);
    if (end == val.c_str() || *end != '\0') return def;
    return (int)v;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val == "true" || val == "1") return true;
    if (val == "false" || val == "0") return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, std::string val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = std::move(val); return; }
      }
      entries.emplace_back(key, std::move(val));
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  void parse(std::istream& in) {
    sections_.clear();
    std::string current;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[') {
        auto close = sv.find(']');
        if (close == std::string_view::npos) continue;
        current = std::string(trim(sv.substr(1, close - 1)));
        ensure_section(current);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key = unquote_key(trim(sv.substr(0, eq)));
      if (key.empty()) continue;
      ensure_section(current).set(key, parse_value(trim(sv.substr(eq + 1))));
    }
  }

  // Strings lose their quotes (basic strings get \" \\ \n \t unescaped),
  // bare values lose a trailing comment.
  static std::string parse_value(std::string_view v) {
    if (v.empty()) return {};
    if (v.front() == '\'') {
      auto end = v.find('\'', 1);
      return std::string(v.substr(1, end == std::string_view::npos ? std::string_view::npos : end - 1));
    }
    if (v.front() == '"') {
      std::string out;
      for (size_t i = 1; i < v.size(); ++i) {
        char c = v[i];
        if (c == '"') break;
        if (c == '\\' && i + 1 < v.size()) {
          char e = v[++i];
          switch (e) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            default: out += e; break;
          }
          continue;
        }
        out += c;
      }
      return out;
    }
    auto hash = v.find('#');
    if (hash != std::string_view::npos) v = trim(v.substr(0, hash));
    std::string out(v);
    // TOML allows 1_000 digit separators
    if (!out.empty() && (std::isdigit((unsigned char)out[0]) || out[0] == '-' || out[0] == '+'))
      std::erase(out, '_');
    return out;
  }

  static std::string unquote_key(std::string_view k) {
    if (k.size() >= 2 && (k.front() == '"' || k.front() == '\'') && k.back() == k.front())
      return std::string(k.substr(1, k.size() - 2));
    return std::string(k);
  }

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace inkwell::util

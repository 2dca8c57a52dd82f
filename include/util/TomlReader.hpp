#pragma once

#include <cctype>
#include <charconv>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::util {

// Flat TOML subset: [section] headers, key = value lines, '#' comments,
// double-quoted strings, integers, floats and booleans. Arrays and inline
// tables are not recognized; such lines are kept as raw strings.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    parse(text);
    return true;
  }

  void parse(std::string_view text) {
    sections_.clear();
    std::string current;
    ensure_section(current);
    size_t pos = 0;
    while (pos <= text.size()) {
      size_t nl = text.find('\n', pos);
      if (nl == std::string_view::npos) nl = text.size();
      auto sv = trim(strip_comment(text.substr(pos, nl - pos)));
      pos = nl + 1;
      if (sv.empty()) continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = val.substr(1, val.size() - 2);
      if (!key.empty()) ensure_section(current).set(key, val);
    }
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* v = find(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* v = find(section, key);
    if (!v) return def;
    auto n = parse_int(*v);
    return n ? *n : def;
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    const auto* v = find(section, key);
    if (!v) return def;
    auto d = parse_double(*v);
    return d ? *d : def;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* v = find(section, key);
    if (!v) return def;
    auto b = parse_bool(*v);
    return b ? *b : def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return find(section, key) != nullptr;
  }

  static std::optional<int> parse_int(std::string_view s) {
    s = trim(s);
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    int out = 0;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || p != s.data() + s.size() || s.empty()) return std::nullopt;
    return out;
  }

  static std::optional<double> parse_double(std::string_view s) {
    s = trim(s);
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    double out = 0.0;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || p != s.data() + s.size() || s.empty()) return std::nullopt;
    return out;
  }

  static std::optional<bool> parse_bool(std::string_view s) {
    s = trim(s);
    if (s == "true" || s == "True" || s == "TRUE" || s == "1") return true;
    if (s == "false" || s == "False" || s == "FALSE" || s == "0") return false;
    return std::nullopt;
  }

private:
  struct Section {
    std::string name;
    std::vector<std::pair<std::string, std::string>> entries;

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }
  };

  std::vector<Section> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& s : sections_)
      if (s.name == name) return s;
    sections_.push_back(Section{name, {}});
    return sections_.back();
  }

  [[nodiscard]] const std::string* find(std::string_view section, std::string_view key) const {
    for (const auto& s : sections_) {
      if (s.name != section) continue;
      for (const auto& [k, v] : s.entries)
        if (k == key) return &v;
    }
    return nullptr;
  }

  // Drops a trailing '#' comment that is not inside a quoted string
  static std::string_view strip_comment(std::string_view sv) {
    bool in_str = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') in_str = !in_str;
      else if (sv[i] == '#' && !in_str) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace vigil::util

#pragma once

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pui::util {

// Read-only reader for the flat TOML subset used by config.toml:
// [section] headers, key = value lines, '#' comments, quoted strings.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(strip_comment(trim(sv.substr(eq + 1))));
      // Strip surrounding quotes from string values
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = val.substr(1, val.size() - 2);
      ensure_section(current_section).set(key, val);
    }
    return true;
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
    try { return std::stoi(val); } catch (const std::exception&) { return def; }
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
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

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

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

  // Drop a trailing "# comment" from an unquoted value
  static std::string_view strip_comment(std::string_view sv) {
    if (!sv.empty() && sv.front() == '"') {
      auto close = sv.find('"', 1);
      if (close != std::string_view::npos) return sv.substr(0, close + 1);
      return sv;
    }
    auto hash = sv.find('#');
    if (hash == std::string_view::npos) return sv;
    return trim(sv.substr(0, hash));
  }
};

} // namespace pui::util

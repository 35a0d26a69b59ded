#pragma once

#include <cctype>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil::util {

// Small TOML subset: [sections], key = value, quoted strings, numbers,
// booleans, single-line string arrays and # comments.
class TomlReader {
public:
  void parse(std::string_view text) {
    sections_.clear();
    errors_.clear();
    if (text.size() >= 3 && text.substr(0, 3) == "\xEF\xBB\xBF") text.remove_prefix(3);
    std::string current_section;
    int lineno = 0;
    while (!text.empty()) {
      auto nl = text.find('\n');
      std::string_view raw = text.substr(0, nl);
      text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);
      ++lineno;
      auto sv = trim(strip_comment(raw));
      if (sv.empty()) continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) {
        errors_.push_back("line " + std::to_string(lineno) + ": expected key = value");
        continue;
      }
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (key.empty()) {
        errors_.push_back("line " + std::to_string(lineno) + ": empty key");
        continue;
      }
      // Strip surrounding quotes from string values
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = val.substr(1, val.size() - 2);
      ensure_section(current_section).set(key, val);
    }
  }

  bool save(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) return false;
    bool first = true;
    for (const auto& [name, sec] : sections_) {
      if (!first) out << '\n';
      first = false;
      if (!name.empty()) out << '[' << name << "]\n";
      for (const auto& [k, v] : sec.entries) {
        if (needs_quoting(v))
          out << k << " = \"" << v << "\"\n";
        else
          out << k << " = " << v << '\n';
      }
    }
    return out.good();
  }

  // ["a", "b"] -> {a, b}. A bare scalar is returned as a one-element list.
  [[nodiscard]] std::vector<std::string> get_list(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    if (!s || !s->has(key)) return {};
    return split_array(s->get(key, ""));
  }

  void set(const std::string& section, const std::string& key, int value) {
    ensure_section(section).set(key, std::to_string(value));
  }

  void set(const std::string& section, const std::string& key, bool value) {
    ensure_section(section).set(key, value ? "true" : "false");
  }

  void set(const std::string& section, const std::string& key, const std::vector<std::string>& values) {
    std::string v = "[";
    for (size_t i = 0; i < values.size(); ++i) {
      if (i) v += ", ";
      v += '"';
      v += values[i];
      v += '"';
    }
    v += ']';
    ensure_section(section).set(key, v);
  }

  [[nodiscard]] static bool is_array(std::string_view raw) {
    return raw.size() >= 2 && raw.front() == '[' && raw.back() == ']';
  }

  [[nodiscard]] std::vector<std::string> section_names() const {
    std::vector<std::string> out;
    for (const auto& [n, s] : sections_) out.push_back(n);
    return out;
  }

  [[nodiscard]] std::vector<std::pair<std::string, std::string>> entries(std::string_view section) const {
    const auto* s = find_section(section);
    return s ? s->entries : std::vector<std::pair<std::string, std::string>>{};
  }

  // Lines that could not be parsed during the last parse().
  [[nodiscard]] const std::vector<std::string>& errors() const { return errors_; }

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
  std::vector<std::string> errors_;

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

  // Drop a trailing # comment unless the # sits inside a quoted string
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static std::vector<std::string> split_array(std::string_view raw) {
    std::vector<std::string> out;
    raw = trim(raw);
    if (!is_array(raw)) {
      if (!raw.empty()) out.emplace_back(raw);
      return out;
    }
    raw = raw.substr(1, raw.size() - 2);
    std::string cur;
    bool quoted = false;
    bool any = false;
    for (char c : raw) {
      if (c == '"') { quoted = !quoted; any = true; continue; }
      if (c == ',' && !quoted) {
        auto item = trim(cur);
        if (!item.empty() || any) out.emplace_back(item);
        cur.clear();
        any = false;
        continue;
      }
      cur += c;
    }
    auto item = trim(cur);
    if (!item.empty() || any) out.emplace_back(item);
    return out;
  }

  static bool needs_quoting(const std::string& val) {
    if (val.empty()) return true;
    if (val == "true" || val == "false") return false;
    if (is_array(val)) return false;
    // Plain numbers (ints and decimals) stay bare
    size_t start = (val[0] == '-') ? 1 : 0;
    bool numeric = (start < val.size());
    bool seen_dot = false;
    for (size_t i = start; i < val.size(); ++i) {
      if (val[i] == '.' && !seen_dot) { seen_dot = true; continue; }
      if (!std::isdigit(static_cast<unsigned char>(val[i]))) { numeric = false; break; }
    }
    if (numeric) return false;
    // Everything else is a string that needs quoting
    return true;
  }
};

} // namespace vigil::util

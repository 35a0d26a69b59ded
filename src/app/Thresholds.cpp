#include "app/Thresholds.hpp"
#include "util/AsciiLower.hpp"
#include "util/Errors.hpp"
#include "util/FileIO.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>

namespace vigil::app {

using util::ConfigurationError;

namespace {

std::string join(const std::vector<std::string>& v, const char* sep) {
  std::string out;
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) out += sep;
    out += v[i];
  }
  return out;
}

std::string json_scalar(const nlohmann::json& j) {
  if (j.is_string()) return j.get<std::string>();
  if (j.is_boolean()) return j.get<bool>() ? "true" : "false";
  return j.dump();
}

} // namespace

ThresholdSet ThresholdSet::from_toml(const util::TomlReader& toml, std::string origin) {
  if (!toml.errors().empty()) {
    throw ConfigurationError(origin + ": " + join(toml.errors(), "; "));
  }
  ThresholdSet t;
  t.origin_ = std::move(origin);
  for (const auto& section : toml.section_names()) {
    auto& sec = t.sections_[section];
    for (const auto& [key, raw] : toml.entries(section)) {
      Value v;
      if (util::TomlReader::is_array(raw)) {
        v.is_list = true;
        v.list = toml.get_list(section, key);
      } else {
        v.scalar = raw;
      }
      sec[key] = std::move(v);
    }
  }
  return t;
}

ThresholdSet ThresholdSet::from_json_text(std::string_view text, std::string origin) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigurationError(origin + ": invalid JSON: " + e.what());
  }
  if (!doc.is_object()) throw ConfigurationError(origin + ": top level must be an object");

  ThresholdSet t;
  t.origin_ = std::move(origin);
  auto put = [&](const std::string& section, const std::string& key, const nlohmann::json& j) {
    if (j.is_null()) return;
    Value v;
    if (j.is_array()) {
      v.is_list = true;
      for (const auto& item : j) {
        if (item.is_object() || item.is_array())
          throw ConfigurationError(t.origin_ + ": " + t.qualified(section, key) + " must be a list of scalars");
        v.list.push_back(json_scalar(item));
      }
    } else if (j.is_object()) {
      throw ConfigurationError(t.origin_ + ": " + t.qualified(section, key) + " nests too deeply");
    } else {
      v.scalar = json_scalar(j);
    }
    t.sections_[section][key] = std::move(v);
  };
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    if (it.value().is_object()) {
      t.sections_[it.key()];
      for (auto inner = it.value().begin(); inner != it.value().end(); ++inner)
        put(it.key(), inner.key(), inner.value());
    } else {
      put("", it.key(), it.value());
    }
  }
  return t;
}

std::string ThresholdSet::qualified(std::string_view section, std::string_view key) const {
  if (section.empty()) return std::string(key);
  return std::string(section) + "." + std::string(key);
}

const ThresholdSet::Value* ThresholdSet::find(std::string_view section, std::string_view key) const {
  if (auto s = sections_.find(section); s != sections_.end()) {
    if (auto k = s->second.find(key); k != s->second.end()) return &k->second;
  }
  if (auto s = sections_.find(std::string_view{}); s != sections_.end()) {
    if (auto k = s->second.find(key); k != s->second.end()) return &k->second;
  }
  return nullptr;
}

void ThresholdSet::require(std::string_view section, std::initializer_list<std::string_view> keys) const {
  std::vector<std::string> missing;
  for (auto key : keys) {
    if (!find(section, key)) missing.push_back(qualified(section, key));
  }
  if (!missing.empty()) {
    throw ConfigurationError(origin_ + ": missing required threshold(s): " + join(missing, ", "));
  }
}

bool ThresholdSet::has(std::string_view section, std::string_view key) const {
  return find(section, key) != nullptr;
}

std::optional<double> ThresholdSet::optional_number(std::string_view section, std::string_view key) const {
  const Value* v = find(section, key);
  if (!v) return std::nullopt;
  if (v->is_list) throw ConfigurationError(origin_ + ": " + qualified(section, key) + " must be a number, not a list");
  auto s = util::trim_copy(v->scalar);
  char* end = nullptr;
  double d = std::strtod(s.c_str(), &end);
  if (s.empty() || end == s.c_str() || *end != '\0' || !std::isfinite(d)) {
    throw ConfigurationError(origin_ + ": " + qualified(section, key) + " is not a number: '" + v->scalar + "'");
  }
  return d;
}

double ThresholdSet::number(std::string_view section, std::string_view key) const {
  auto d = optional_number(section, key);
  if (!d) throw ConfigurationError(origin_ + ": missing required threshold: " + qualified(section, key));
  return *d;
}

double ThresholdSet::number_or(std::string_view section, std::string_view key, double def) const {
  auto d = optional_number(section, key);
  return d ? *d : def;
}

bool ThresholdSet::flag_or(std::string_view section, std::string_view key, bool def) const {
  const Value* v = find(section, key);
  if (!v) return def;
  auto s = util::to_lower_copy(util::trim_view(v->scalar));
  if (!v->is_list) {
    if (s == "true" || s == "1" || s == "yes") return true;
    if (s == "false" || s == "0" || s == "no") return false;
  }
  throw ConfigurationError(origin_ + ": " + qualified(section, key) + " is not a boolean: '" + v->scalar + "'");
}

std::vector<std::string> ThresholdSet::list_or(std::string_view section, std::string_view key,
                                               std::vector<std::string> def) const {
  const Value* v = find(section, key);
  if (!v) return def;
  if (v->is_list) return v->list;
  // A lone scalar counts as a one-element list
  if (v->scalar.empty()) return {};
  return {v->scalar};
}

std::vector<std::pair<std::string, std::string>> ThresholdSet::describe(std::string_view section) const {
  std::map<std::string, std::string> merged;
  auto add_from = [&](std::string_view name) {
    auto s = sections_.find(name);
    if (s == sections_.end()) return;
    for (const auto& [key, v] : s->second) {
      merged[key] = v.is_list ? "[" + join(v.list, ", ") + "]" : v.scalar;
    }
  };
  add_from(std::string_view{});
  add_from(section);
  std::vector<std::pair<std::string, std::string>> out;
  for (auto& [key, value] : merged) out.emplace_back(qualified(section, key), std::move(value));
  return out;
}

ThresholdSet load_thresholds(const std::filesystem::path& path) {
  auto text = util::read_text_file(path);
  if (!text) throw ConfigurationError("cannot read thresholds file " + path.string());
  auto ext = util::to_lower_copy(path.extension().string());
  if (ext == ".json") return ThresholdSet::from_json_text(*text, path.string());
  util::TomlReader toml;
  toml.parse(*text);
  return ThresholdSet::from_toml(toml, path.string());
}

util::TomlReader default_thresholds_toml() {
  util::TomlReader t;
  t.set("backup", "stale_after_days", 3);
  t.set("backup", "warning_days", 2);
  t.set("backup", "warning_values", std::vector<std::string>{"warning"});
  t.set("backup", "failure_values", std::vector<std::string>{"failed", "failure", "error"});
  t.set("backup", "fail_on_warning_result", false);

  t.set("endpoint", "disk_free_warn_pct", 20);
  t.set("endpoint", "disk_free_alert_pct", 10);
  t.set("endpoint", "cpu_warn_pct", 80);
  t.set("endpoint", "cpu_alert_pct", 95);
  t.set("endpoint", "mem_used_warn_pct", 85);
  t.set("endpoint", "mem_used_alert_pct", 95);
  t.set("endpoint", "service_allowlist", std::vector<std::string>{"gupdate", "sppsvc", "RemoteRegistry"});

  t.set("perf", "cpu_warn", 70);
  t.set("perf", "cpu_alert", 85);
  t.set("perf", "committed_warn", 75);
  t.set("perf", "committed_alert", 85);
  t.set("perf", "disk_queue_warn", 2);
  t.set("perf", "disk_queue_alert", 4);
  t.set("perf", "available_mb_warn", 1024);
  t.set("perf", "available_mb_alert", 512);
  return t;
}

std::filesystem::path default_thresholds_path() {
  if (const char* env = util::getenv_compat("VIGIL_THRESHOLDS")) return env;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::filesystem::path(xdg) / "vigil" / "thresholds.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::filesystem::path(home) / ".config" / "vigil" / "thresholds.toml";
  return {};
}

} // namespace vigil::app

#pragma once
#include "util/TomlReader.hpp"
#include <filesystem>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil::app {

// Immutable set of named limits for one run. Values live in sections
// ([backup], [endpoint], [perf]); keys outside any section apply to every
// section that does not define them itself.
class ThresholdSet {
public:
  ThresholdSet() = default;

  [[nodiscard]] static ThresholdSet from_toml(const util::TomlReader& toml, std::string origin = "<toml>");
  [[nodiscard]] static ThresholdSet from_json_text(std::string_view text, std::string origin = "<json>");

  // Throws ConfigurationError naming every absent key.
  void require(std::string_view section, std::initializer_list<std::string_view> keys) const;

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const;

  // Throws ConfigurationError if absent or not a finite number.
  [[nodiscard]] double number(std::string_view section, std::string_view key) const;
  [[nodiscard]] std::optional<double> optional_number(std::string_view section, std::string_view key) const;
  [[nodiscard]] double number_or(std::string_view section, std::string_view key, double def) const;

  // Throws ConfigurationError if present but not a boolean.
  [[nodiscard]] bool flag_or(std::string_view section, std::string_view key, bool def) const;

  [[nodiscard]] std::vector<std::string> list_or(std::string_view section, std::string_view key,
                                                 std::vector<std::string> def) const;

  // Effective "section.key" -> value pairs for one section, fallbacks included.
  [[nodiscard]] std::vector<std::pair<std::string, std::string>> describe(std::string_view section) const;

  [[nodiscard]] const std::string& origin() const { return origin_; }

private:
  struct Value {
    std::string scalar;
    std::vector<std::string> list;
    bool is_list{false};
  };

  [[nodiscard]] const Value* find(std::string_view section, std::string_view key) const;
  [[nodiscard]] std::string qualified(std::string_view section, std::string_view key) const;

  std::map<std::string, std::map<std::string, Value, std::less<>>, std::less<>> sections_;
  std::string origin_;
};

// Loads TOML, or JSON when the extension is .json. Throws ConfigurationError.
[[nodiscard]] ThresholdSet load_thresholds(const std::filesystem::path& path);

// Default limits for every profile, in the layout load_thresholds reads.
[[nodiscard]] util::TomlReader default_thresholds_toml();

// $VIGIL_THRESHOLDS, else $XDG_CONFIG_HOME/vigil/thresholds.toml, else
// ~/.config/vigil/thresholds.toml. Empty if none of these can be formed.
[[nodiscard]] std::filesystem::path default_thresholds_path();

} // namespace vigil::app

#pragma once
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace vigil::util {

// Whole-string decimal parse; surrounding blanks allowed, nothing else.
inline std::optional<double> parse_double(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r')) sv.remove_suffix(1);
  if (sv.empty()) return std::nullopt;
  std::string s(sv);
  char* end = nullptr;
  double d = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || !std::isfinite(d)) return std::nullopt;
  return d;
}

} // namespace vigil::util

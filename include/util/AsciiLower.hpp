#pragma once
#include <string>
#include <string_view>

namespace vigil::util {

constexpr char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

inline std::string to_lower_copy(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) out.push_back(ascii_lower(c));
  return out;
}

inline std::string_view trim_view(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r' || sv.front() == '\n')) sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' || sv.back() == '\n')) sv.remove_suffix(1);
  return sv;
}

inline std::string trim_copy(std::string_view sv) { return std::string(trim_view(sv)); }

} // namespace vigil::util

#include "util/TimeFormat.hpp"

#include <cstdio>
#include <ctime>

namespace vigil::util {

namespace {

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
  static constexpr int kDays[12] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (m == 2 && is_leap(y)) return 29;
  return kDays[m - 1];
}

// Reads exactly n digits at pos; advances pos on success.
bool read_digits(std::string_view s, size_t& pos, size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (size_t i = 0; i < n; ++i) {
    char c = s[pos + i];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  pos += n;
  return true;
}

bool expect(std::string_view s, size_t& pos, char c) {
  if (pos < s.size() && s[pos] == c) { ++pos; return true; }
  return false;
}

std::tm local_tm(TimePoint tp) {
  std::time_t t = Clock::to_time_t(tp);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  return tm;
}

} // namespace

auto parse_iso_datetime(std::string_view s) -> std::optional<TimePoint> {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
  if (s.empty()) return std::nullopt;

  size_t pos = 0;
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  long micros = 0;
  if (!read_digits(s, pos, 4, year) || !expect(s, pos, '-') ||
      !read_digits(s, pos, 2, month) || !expect(s, pos, '-') ||
      !read_digits(s, pos, 2, day)) return std::nullopt;
  if (month < 1 || month > 12) return std::nullopt;
  if (day < 1 || day > days_in_month(year, month)) return std::nullopt;

  if (pos < s.size() && (s[pos] == 'T' || s[pos] == ' ')) {
    ++pos;
    if (!read_digits(s, pos, 2, hour) || !expect(s, pos, ':') || !read_digits(s, pos, 2, minute))
      return std::nullopt;
    if (expect(s, pos, ':')) {
      if (!read_digits(s, pos, 2, second)) return std::nullopt;
      if (expect(s, pos, '.') || expect(s, pos, ',')) {
        size_t start = pos;
        long scale = 100000;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
          if (scale > 0) { micros += (s[pos] - '0') * scale; scale /= 10; }
          ++pos;
        }
        if (pos == start) return std::nullopt;
      }
    }
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;
  }

  bool has_offset = false;
  long offset_secs = 0;
  if (pos < s.size()) {
    char c = s[pos];
    if (c == 'Z' || c == 'z') {
      has_offset = true;
      ++pos;
    } else if (c == '+' || c == '-') {
      ++pos;
      int oh = 0, om = 0;
      if (!read_digits(s, pos, 2, oh)) return std::nullopt;
      expect(s, pos, ':');
      if (!read_digits(s, pos, 2, om)) return std::nullopt;
      if (oh > 23 || om > 59) return std::nullopt;
      has_offset = true;
      offset_secs = (oh * 3600L + om * 60L) * (c == '-' ? -1 : 1);
    }
  }
  if (pos != s.size()) return std::nullopt;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  std::time_t t;
  if (has_offset) {
    t = ::timegm(&tm) - offset_secs;
  } else {
    tm.tm_isdst = -1;
    t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
  }
  return Clock::from_time_t(t) + std::chrono::microseconds(micros);
}

std::string format_iso_local(TimePoint tp) {
  std::tm tm = local_tm(tp);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

std::string format_stamp_local(TimePoint tp) {
  std::tm tm = local_tm(tp);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02d_%02d%02d%02d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

double days_between(TimePoint from, TimePoint to) {
  return std::chrono::duration<double>(to - from).count() / 86400.0;
}

} // namespace vigil::util

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace vigil::util {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Accepts YYYY-MM-DD, optionally followed by 'T' or ' ' and HH:MM[:SS[.frac]],
// optionally followed by 'Z' or a +HH:MM / +HHMM offset. Strings without an
// offset are local time. Returns std::nullopt for anything else, including
// out-of-range fields.
[[nodiscard]] auto parse_iso_datetime(std::string_view s) -> std::optional<TimePoint>;

// 2026-01-17T02:10:00 in local time, second precision.
[[nodiscard]] std::string format_iso_local(TimePoint tp);

// 20260117_021000 in local time, used for directory names.
[[nodiscard]] std::string format_stamp_local(TimePoint tp);

// Elapsed days from `from` to `to`; negative when `from` is in the future.
[[nodiscard]] double days_between(TimePoint from, TimePoint to);

} // namespace vigil::util

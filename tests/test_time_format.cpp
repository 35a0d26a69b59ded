#include "minitest.hpp"
#include "util/TimeFormat.hpp"
#include <chrono>
#include <string>

using vigil::util::parse_iso_datetime;

static long long epoch_seconds(vigil::util::TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TEST(time_parse_utc_and_offsets) {
  auto z = parse_iso_datetime("2026-01-17T02:10:00Z");
  ASSERT_TRUE(z.has_value());
  ASSERT_EQ(epoch_seconds(*z), 1768615800LL);
  auto plus = parse_iso_datetime("2026-01-17T04:10:00+02:00");
  ASSERT_TRUE(plus.has_value());
  ASSERT_EQ(epoch_seconds(*plus), 1768615800LL);
  auto minus = parse_iso_datetime("2026-01-16 21:10:00-0500");
  ASSERT_TRUE(minus.has_value());
  ASSERT_EQ(epoch_seconds(*minus), 1768615800LL);
}

TEST(time_parse_partial_forms) {
  auto no_seconds = parse_iso_datetime("2026-01-17T02:10Z");
  ASSERT_TRUE(no_seconds.has_value());
  ASSERT_EQ(epoch_seconds(*no_seconds), 1768615800LL);
  auto frac = parse_iso_datetime("2026-01-17T02:10:00.750Z");
  ASSERT_TRUE(frac.has_value());
  ASSERT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(frac->time_since_epoch()).count(),
            1768615800750LL);
  ASSERT_TRUE(parse_iso_datetime("2026-01-17").has_value());
  ASSERT_TRUE(parse_iso_datetime(" 2026-01-17T02:10:00 ").has_value());
}

TEST(time_parse_rejects_garbage) {
  ASSERT_TRUE(!parse_iso_datetime("").has_value());
  ASSERT_TRUE(!parse_iso_datetime("yesterday").has_value());
  ASSERT_TRUE(!parse_iso_datetime("2026-13-01").has_value());
  ASSERT_TRUE(!parse_iso_datetime("2026-02-30").has_value());
  ASSERT_TRUE(!parse_iso_datetime("2026-01-17T25:00:00").has_value());
  ASSERT_TRUE(!parse_iso_datetime("2026-01-17T02:10:00 extra").has_value());
  ASSERT_TRUE(!parse_iso_datetime("1/17/2026 2:10:00 AM").has_value());
  ASSERT_TRUE(parse_iso_datetime("2024-02-29").has_value());
}

TEST(time_days_between) {
  auto a = *parse_iso_datetime("2026-01-10T00:00:00Z");
  auto b = *parse_iso_datetime("2026-01-14T12:00:00Z");
  ASSERT_EQ(vigil::util::days_between(a, b), 4.5);
  ASSERT_EQ(vigil::util::days_between(b, a), -4.5);
}

TEST(time_local_formats_round_trip) {
  // Naive strings are local time, so formatting back in local time is exact.
  auto tp = parse_iso_datetime("2026-03-05T07:08:09");
  ASSERT_TRUE(tp.has_value());
  ASSERT_EQ(vigil::util::format_iso_local(*tp), "2026-03-05T07:08:09");
  ASSERT_EQ(vigil::util::format_stamp_local(*tp), "20260305_070809");
}

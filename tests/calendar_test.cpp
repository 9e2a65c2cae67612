#include "cronkit/cron/calendar.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace cronkit;
using namespace cronkit::test;

TEST(CalendarTest, LeapYears) {
  EXPECT_TRUE(is_leap_year(2024));
  EXPECT_TRUE(is_leap_year(2000));
  EXPECT_FALSE(is_leap_year(1900));
  EXPECT_FALSE(is_leap_year(2023));
  EXPECT_FALSE(is_leap_year(2100));
}

TEST(CalendarTest, DaysInMonth) {
  EXPECT_EQ(days_in_month(2023, 2), 28);
  EXPECT_EQ(days_in_month(2024, 2), 29);
  EXPECT_EQ(days_in_month(2024, 4), 30);
  EXPECT_EQ(days_in_month(2024, 12), 31);
}

TEST(CalendarTest, DayOfWeekIsOneBasedFromSunday) {
  EXPECT_EQ(day_of_week(1970, 1, 1), 5);   // Thursday
  EXPECT_EQ(day_of_week(2024, 1, 7), kSunday);
  EXPECT_EQ(day_of_week(2024, 1, 6), kSaturday);
  EXPECT_EQ(day_of_week(2020, 4, 18), kSaturday);
}

TEST(CalendarTest, Weekdays) {
  EXPECT_FALSE(is_weekday(kSunday));
  EXPECT_TRUE(is_weekday(2));
  EXPECT_TRUE(is_weekday(6));
  EXPECT_FALSE(is_weekday(kSaturday));
}

TEST(CalendarTest, ShiftSecondsCarriesAcrossYear) {
  EXPECT_EQ(shift_seconds(civil(2023, 12, 31, 23, 59, 59), 1),
            civil(2024, 1, 1));
  EXPECT_EQ(shift_seconds(civil(2024, 3, 1), -1),
            civil(2024, 2, 29, 23, 59, 59));
}

TEST(CalendarTest, UtcRoundTrip) {
  auto tp = utc(2020, 4, 16, 12, 30, 5);
  EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(
                tp.time_since_epoch())
                .count(),
            1587040205);
  EXPECT_EQ(as_utc(tp), civil(2020, 4, 16, 12, 30, 5));
}

TEST(CalendarTest, ToCivilTruncatesSubSeconds) {
  auto tp = utc(2020, 1, 1, 0, 0, 10) + std::chrono::milliseconds(999);
  EXPECT_EQ(as_utc(tp), civil(2020, 1, 1, 0, 0, 10));
}

TEST(CalendarTest, ParseTimeZoneNames) {
  EXPECT_EQ(parse_time_zone("UTC"), TimeZone::Utc);
  EXPECT_EQ(parse_time_zone("gmt"), TimeZone::Utc);
  EXPECT_EQ(parse_time_zone("local"), TimeZone::Local);
  EXPECT_EQ(parse_time_zone("System"), TimeZone::Local);
  EXPECT_FALSE(parse_time_zone("Europe/Paris").has_value());
  EXPECT_EQ(time_zone_name(TimeZone::Utc), "utc");
}

TEST(CalendarTest, LocalZoneFollowsTz) {
  ScopedTimeZone tz("America/New_York");
  auto tp = utc(2024, 7, 1, 16, 0, 0);
  EXPECT_EQ(to_civil(tp, TimeZone::Local), civil(2024, 7, 1, 12, 0, 0));
  EXPECT_EQ(from_civil(civil(2024, 7, 1, 12, 0, 0), TimeZone::Local), tp);
}

TEST(CalendarTest, SkippedLocalTimeDoesNotExist) {
  ScopedTimeZone tz("America/New_York");
  // Clocks jump from 02:00 to 03:00 on 2024-03-10.
  EXPECT_FALSE(
      from_civil(civil(2024, 3, 10, 2, 30, 0), TimeZone::Local).has_value());
  EXPECT_TRUE(
      from_civil(civil(2024, 3, 10, 3, 30, 0), TimeZone::Local).has_value());
}

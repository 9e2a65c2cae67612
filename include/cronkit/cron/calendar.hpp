#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace cronkit {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class TimeZone : std::uint8_t { Utc, Local };

[[nodiscard]] constexpr auto time_zone_name(TimeZone zone) noexcept
    -> std::string_view {
  switch (zone) {
    case TimeZone::Utc: return "utc";
    case TimeZone::Local: return "local";
  }
  return "utc";
}

[[nodiscard]] auto parse_time_zone(std::string_view name) noexcept
    -> std::optional<TimeZone>;

// Broken-down wall-clock time. Month 1-12, day 1-31.
struct CivilTime {
  int year{1970};
  int month{1};
  int day{1};
  int hour{0};
  int minute{0};
  int second{0};

  friend auto operator<=>(const CivilTime&, const CivilTime&) = default;
};

[[nodiscard]] constexpr auto is_leap_year(int year) noexcept -> bool {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

[[nodiscard]] constexpr auto days_in_month(int year, int month) noexcept
    -> int {
  constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year))
    return 29;
  return days[month - 1];
}

// 1=SUN .. 7=SAT
[[nodiscard]] auto day_of_week(int year, int month, int day) -> int;

[[nodiscard]] constexpr auto is_weekday(int dow) noexcept -> bool {
  return dow >= 2 && dow <= 6;
}

// Wall-clock time moved by whole seconds, ignoring any zone.
[[nodiscard]] auto shift_seconds(const CivilTime& t, std::int64_t seconds)
    -> CivilTime;

// Sub-second parts are truncated.
[[nodiscard]] auto to_civil(TimePoint tp, TimeZone zone) -> CivilTime;

// nullopt when the wall-clock time does not exist in the local zone
// (skipped by a daylight-saving transition).
[[nodiscard]] auto from_civil(const CivilTime& t, TimeZone zone)
    -> std::optional<TimePoint>;

}  // namespace cronkit

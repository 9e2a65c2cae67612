#include "cronkit/cron/calendar.hpp"

#include "cronkit/util/strings.hpp"

#include <ctime>

namespace cronkit {
namespace {

using std::chrono::days;
using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::seconds;
using std::chrono::sys_days;
using std::chrono::sys_seconds;

auto to_sys_days(int year, int month, int day) -> sys_days {
  return sys_days{std::chrono::year{year} /
                  std::chrono::month{static_cast<unsigned>(month)} /
                  std::chrono::day{static_cast<unsigned>(day)}};
}

auto to_sys_seconds(const CivilTime& t) -> sys_seconds {
  return to_sys_days(t.year, t.month, t.day) + hours{t.hour} +
         minutes{t.minute} + seconds{t.second};
}

auto from_sys_seconds(sys_seconds s) -> CivilTime {
  auto dp = std::chrono::floor<days>(s);
  std::chrono::year_month_day ymd{dp};
  std::chrono::hh_mm_ss hms{s - dp};
  return CivilTime{static_cast<int>(ymd.year()),
                   static_cast<int>(static_cast<unsigned>(ymd.month())),
                   static_cast<int>(static_cast<unsigned>(ymd.day())),
                   static_cast<int>(hms.hours().count()),
                   static_cast<int>(hms.minutes().count()),
                   static_cast<int>(hms.seconds().count())};
}

auto from_tm(const std::tm& tm) -> CivilTime {
  return CivilTime{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                   tm.tm_hour,        tm.tm_min,     tm.tm_sec};
}

}  // namespace

auto parse_time_zone(std::string_view name) noexcept -> std::optional<TimeZone> {
  if (strings::iequals(name, "utc") || strings::iequals(name, "gmt"))
    return TimeZone::Utc;
  if (strings::iequals(name, "local") || strings::iequals(name, "system"))
    return TimeZone::Local;
  return std::nullopt;
}

auto day_of_week(int year, int month, int day) -> int {
  std::chrono::weekday wd{to_sys_days(year, month, day)};
  return static_cast<int>(wd.c_encoding()) + 1;
}

auto shift_seconds(const CivilTime& t, std::int64_t secs) -> CivilTime {
  return from_sys_seconds(to_sys_seconds(t) + seconds{secs});
}

auto to_civil(TimePoint tp, TimeZone zone) -> CivilTime {
  auto secs = std::chrono::floor<seconds>(tp);
  if (zone == TimeZone::Utc) {
    return from_sys_seconds(secs);
  }
  std::time_t t = Clock::to_time_t(secs);
  std::tm tm{};
  localtime_r(&t, &tm);
  return from_tm(tm);
}

auto from_civil(const CivilTime& t, TimeZone zone) -> std::optional<TimePoint> {
  if (zone == TimeZone::Utc) {
    return TimePoint{to_sys_seconds(t)};
  }

  std::tm tm{};
  tm.tm_year = t.year - 1900;
  tm.tm_mon = t.month - 1;
  tm.tm_mday = t.day;
  tm.tm_hour = t.hour;
  tm.tm_min = t.minute;
  tm.tm_sec = t.second;
  tm.tm_isdst = -1;
  std::time_t epoch = std::mktime(&tm);
  if (epoch == static_cast<std::time_t>(-1))
    return std::nullopt;

  // mktime normalizes a skipped wall-clock time into the next hour
  std::tm check{};
  localtime_r(&epoch, &check);
  if (from_tm(check) != t)
    return std::nullopt;
  return Clock::from_time_t(epoch);
}

}  // namespace cronkit

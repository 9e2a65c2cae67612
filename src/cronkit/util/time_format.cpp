#include "cronkit/util/time_format.hpp"

#include "cronkit/util/strings.hpp"

#include <chrono>
#include <ctime>

namespace cronkit {
namespace {

auto to_tm(TimePoint tp, TimeZone zone) -> std::tm {
  std::time_t t = Clock::to_time_t(std::chrono::floor<std::chrono::seconds>(tp));
  std::tm tm{};
  if (zone == TimeZone::Utc) {
    gmtime_r(&t, &tm);
  } else {
    localtime_r(&t, &tm);
  }
  return tm;
}

auto read_number(std::string_view text, std::size_t pos, std::size_t len)
    -> std::optional<int> {
  if (pos + len > text.size())
    return std::nullopt;
  return strings::parse_int(text.substr(pos, len));
}

}  // namespace

auto format_time(TimePoint tp, std::string_view pattern, TimeZone zone)
    -> std::string {
  if (pattern.empty())
    return {};

  const std::tm tm = to_tm(tp, zone);
  // strftime returns 0 both for an empty expansion and for a short buffer,
  // so a trailing sentinel keeps every successful expansion non-empty
  std::string fmt(pattern);
  fmt.push_back(' ');

  std::string out(64, '\0');
  for (int attempt = 0; attempt < 6; ++attempt) {
    std::size_t n = std::strftime(out.data(), out.size(), fmt.c_str(), &tm);
    if (n > 0) {
      out.resize(n - 1);
      return out;
    }
    out.resize(out.size() * 4);
  }
  return {};
}

auto parse_civil_time(std::string_view text) -> Result<CivilTime> {
  text = strings::trim(text);
  // YYYY-MM-DD[( |T)HH:MM:SS]
  if (text.size() != 10 && text.size() != 19)
    return fail(Error::InvalidArgument);
  if (text[4] != '-' || text[7] != '-')
    return fail(Error::InvalidArgument);

  CivilTime c;
  auto year = read_number(text, 0, 4);
  auto month = read_number(text, 5, 2);
  auto day = read_number(text, 8, 2);
  if (!year || !month || !day)
    return fail(Error::InvalidArgument);
  c.year = *year;
  c.month = *month;
  c.day = *day;

  if (text.size() == 19) {
    if ((text[10] != ' ' && text[10] != 'T') || text[13] != ':' ||
        text[16] != ':') {
      return fail(Error::InvalidArgument);
    }
    auto hour = read_number(text, 11, 2);
    auto minute = read_number(text, 14, 2);
    auto second = read_number(text, 17, 2);
    if (!hour || !minute || !second)
      return fail(Error::InvalidArgument);
    c.hour = *hour;
    c.minute = *minute;
    c.second = *second;
  }

  if (c.month < 1 || c.month > 12 || c.day < 1 ||
      c.day > days_in_month(c.year, c.month) || c.hour < 0 || c.hour > 23 ||
      c.minute < 0 || c.minute > 59 || c.second < 0 || c.second > 59) {
    return fail(Error::InvalidArgument);
  }
  return c;
}

auto parse_time(std::string_view text, TimeZone zone) -> Result<TimePoint> {
  auto civil = parse_civil_time(text);
  if (!civil)
    return fail(civil.error());
  auto tp = from_civil(*civil, zone);
  if (!tp)
    return fail(Error::InvalidArgument);
  return *tp;
}

}  // namespace cronkit

#include "cronkit/cron/walker.hpp"

#include <algorithm>

namespace cronkit::walker {
namespace {

// Only the day fields carry markers; the compiler emits a ValueSet for
// every other field.
auto value_set(const CronExpr& expr, FieldKind kind) -> const ValueSet& {
  return std::get<ValueSet>(expr.field(kind));
}

auto nearest_weekday(int year, int month, int target) -> std::optional<int> {
  const int dim = days_in_month(year, month);
  if (target > dim)
    return std::nullopt;
  switch (day_of_week(year, month, target)) {
    case kSaturday: return target == 1 ? target + 2 : target - 1;
    case kSunday: return target == dim ? target - 2 : target + 1;
    default: return target;
  }
}

auto last_weekday(int year, int month) -> int {
  const int dim = days_in_month(year, month);
  switch (day_of_week(year, month, dim)) {
    case kSaturday: return dim - 1;
    case kSunday: return dim - 2;
    default: return dim;
  }
}

auto constraint_matches_day(const FieldConstraint& constraint, int year,
                            int month, int day) -> bool {
  const int dim = days_in_month(year, month);
  return std::visit(
      overloaded{
          [&](const ValueSet& set) {
            return set.kind() == FieldKind::DayOfWeek
                       ? set.test(day_of_week(year, month, day))
                       : set.test(day);
          },
          [](const NoSpecificValue&) { return true; },
          [&](const LastDayOfMonth& c) { return day == dim - c.offset; },
          [&](const LastWeekdayOfMonth&) {
            return day == last_weekday(year, month);
          },
          [&](const NearestWeekday& c) {
            auto target = nearest_weekday(year, month, c.day);
            return target && *target == day;
          },
          [&](const NthDayOfWeek& c) {
            return day_of_week(year, month, day) == c.day_of_week &&
                   (day - 1) / 7 + 1 == c.occurrence;
          },
          [&](const LastDayOfWeek& c) {
            return day_of_week(year, month, day) == c.day_of_week &&
                   day + 7 > dim;
          },
      },
      constraint);
}

auto next_matching_day(const CronExpr& expr, int year, int month, int from)
    -> std::optional<int> {
  const int dim = days_in_month(year, month);
  for (int d = std::max(from, 1); d <= dim; ++d) {
    if (day_matches(expr, year, month, d))
      return d;
  }
  return std::nullopt;
}

auto prev_matching_day(const CronExpr& expr, int year, int month, int from)
    -> std::optional<int> {
  for (int d = std::min(from, days_in_month(year, month)); d >= 1; --d) {
    if (day_matches(expr, year, month, d))
      return d;
  }
  return std::nullopt;
}

auto reset_time_min(CivilTime& c) -> void {
  c.hour = 0;
  c.minute = 0;
  c.second = 0;
}

auto reset_time_max(CivilTime& c) -> void {
  c.hour = 23;
  c.minute = 59;
  c.second = 59;
}

auto roll_month_forward(CivilTime& c) -> void {
  c.day = 1;
  reset_time_min(c);
  if (++c.month > 12) {
    c.month = 1;
    ++c.year;
  }
}

auto roll_day_forward(CivilTime& c) -> void {
  reset_time_min(c);
  if (++c.day > days_in_month(c.year, c.month))
    roll_month_forward(c);
}

auto roll_hour_forward(CivilTime& c) -> void {
  c.minute = 0;
  c.second = 0;
  if (++c.hour > 23)
    roll_day_forward(c);
}

auto roll_minute_forward(CivilTime& c) -> void {
  c.second = 0;
  if (++c.minute > 59)
    roll_hour_forward(c);
}

// Day 31 is clamped to the month length on the next pass.
auto roll_month_backward(CivilTime& c) -> void {
  c.day = 31;
  reset_time_max(c);
  if (--c.month < 1) {
    c.month = 12;
    --c.year;
  }
}

auto roll_day_backward(CivilTime& c) -> void {
  reset_time_max(c);
  if (--c.day < 1)
    roll_month_backward(c);
}

auto roll_hour_backward(CivilTime& c) -> void {
  c.minute = 59;
  c.second = 59;
  if (--c.hour < 0)
    roll_day_backward(c);
}

auto roll_minute_backward(CivilTime& c) -> void {
  c.second = 59;
  if (--c.minute < 0)
    roll_hour_backward(c);
}

}  // namespace

auto day_matches(const CronExpr& expr, int year, int month, int day) -> bool {
  const auto& dom = expr.field(FieldKind::DayOfMonth);
  const auto& dow = expr.field(FieldKind::DayOfWeek);

  if (expr.day_fields_ored()) {
    return constraint_matches_day(dom, year, month, day) ||
           constraint_matches_day(dow, year, month, day);
  }
  if (is_restricted(dom))
    return constraint_matches_day(dom, year, month, day);
  if (is_restricted(dow))
    return constraint_matches_day(dow, year, month, day);
  return true;
}

auto matches(const CronExpr& expr, const CivilTime& t) -> bool {
  if (t.month < 1 || t.month > 12 || t.day < 1 ||
      t.day > days_in_month(t.year, t.month)) {
    return false;
  }
  return value_set(expr, FieldKind::Year).test(t.year) &&
         value_set(expr, FieldKind::Month).test(t.month) &&
         day_matches(expr, t.year, t.month, t.day) &&
         value_set(expr, FieldKind::Hour).test(t.hour) &&
         value_set(expr, FieldKind::Minute).test(t.minute) &&
         value_set(expr, FieldKind::Second).test(t.second);
}

auto find_next(const CronExpr& expr, CivilTime c) -> std::optional<CivilTime> {
  const auto& years = value_set(expr, FieldKind::Year);
  const auto& months = value_set(expr, FieldKind::Month);
  const auto& hours = value_set(expr, FieldKind::Hour);
  const auto& minutes = value_set(expr, FieldKind::Minute);
  const auto& seconds = value_set(expr, FieldKind::Second);

  while (true) {
    if (c.year > kMaxYear)
      return std::nullopt;
    auto y = years.next_at_or_after(c.year);
    if (!y)
      return std::nullopt;
    if (*y != c.year)
      c = CivilTime{*y, 1, 1, 0, 0, 0};

    auto m = months.next_at_or_after(c.month);
    if (!m) {
      c = CivilTime{c.year + 1, 1, 1, 0, 0, 0};
      continue;
    }
    if (*m != c.month) {
      c.month = *m;
      c.day = 1;
      reset_time_min(c);
    }

    auto d = next_matching_day(expr, c.year, c.month, c.day);
    if (!d) {
      roll_month_forward(c);
      continue;
    }
    if (*d != c.day) {
      c.day = *d;
      reset_time_min(c);
    }

    auto h = hours.next_at_or_after(c.hour);
    if (!h) {
      roll_day_forward(c);
      continue;
    }
    if (*h != c.hour) {
      c.hour = *h;
      c.minute = 0;
      c.second = 0;
    }

    auto mi = minutes.next_at_or_after(c.minute);
    if (!mi) {
      roll_hour_forward(c);
      continue;
    }
    if (*mi != c.minute) {
      c.minute = *mi;
      c.second = 0;
    }

    auto s = seconds.next_at_or_after(c.second);
    if (!s) {
      roll_minute_forward(c);
      continue;
    }
    c.second = *s;
    return c;
  }
}

auto find_previous(const CronExpr& expr, CivilTime c)
    -> std::optional<CivilTime> {
  const auto& years = value_set(expr, FieldKind::Year);
  const auto& months = value_set(expr, FieldKind::Month);
  const auto& hours = value_set(expr, FieldKind::Hour);
  const auto& minutes = value_set(expr, FieldKind::Minute);
  const auto& seconds = value_set(expr, FieldKind::Second);

  while (true) {
    if (c.year < kMinYear)
      return std::nullopt;
    auto y = years.prev_at_or_before(c.year);
    if (!y)
      return std::nullopt;
    if (*y != c.year)
      c = CivilTime{*y, 12, 31, 23, 59, 59};

    auto m = months.prev_at_or_before(c.month);
    if (!m) {
      c = CivilTime{c.year - 1, 12, 31, 23, 59, 59};
      continue;
    }
    if (*m != c.month) {
      c.month = *m;
      c.day = 31;
      reset_time_max(c);
    }
    c.day = std::min(c.day, days_in_month(c.year, c.month));

    auto d = prev_matching_day(expr, c.year, c.month, c.day);
    if (!d) {
      roll_month_backward(c);
      continue;
    }
    if (*d != c.day) {
      c.day = *d;
      reset_time_max(c);
    }

    auto h = hours.prev_at_or_before(c.hour);
    if (!h) {
      roll_day_backward(c);
      continue;
    }
    if (*h != c.hour) {
      c.hour = *h;
      c.minute = 59;
      c.second = 59;
    }

    auto mi = minutes.prev_at_or_before(c.minute);
    if (!mi) {
      roll_hour_backward(c);
      continue;
    }
    if (*mi != c.minute) {
      c.minute = *mi;
      c.second = 59;
    }

    auto s = seconds.prev_at_or_before(c.second);
    if (!s) {
      roll_minute_backward(c);
      continue;
    }
    c.second = *s;
    return c;
  }
}

auto next_after(const CronExpr& expr, const CivilTime& t)
    -> std::optional<CivilTime> {
  return find_next(expr, shift_seconds(t, 1));
}

auto previous_before(const CronExpr& expr, const CivilTime& t)
    -> std::optional<CivilTime> {
  return find_previous(expr, shift_seconds(t, -1));
}

}  // namespace cronkit::walker

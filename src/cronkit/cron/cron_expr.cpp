#include "cronkit/cron/cron_expr.hpp"

#include "cronkit/cron/field_compiler.hpp"
#include "cronkit/cron/tokenizer.hpp"
#include "cronkit/cron/walker.hpp"
#include "cronkit/util/strings.hpp"

#include <algorithm>

namespace cronkit {

CronExpr::CronExpr(std::string raw, Fields fields)
    : raw_(std::move(raw)), fields_(std::move(fields)) {
  day_fields_ored_ = is_restricted(field(FieldKind::DayOfMonth)) &&
                     is_restricted(field(FieldKind::DayOfWeek));
}

auto CronExpr::parse(std::string_view expr) -> ParseResult<CronExpr> {
  auto trimmed = strings::trim(expr);

  auto expanded = expand_macro(trimmed);
  if (!expanded) {
    return malformed(std::nullopt, static_cast<std::size_t>(
                                       trimmed.data() - expr.data()),
                     "unknown macro '" + std::string(trimmed) + "'");
  }

  auto tokens = tokenize(*expanded);
  if (!tokens)
    return std::unexpected{std::move(tokens.error())};

  Fields fields{ValueSet::full(FieldKind::Second),
                ValueSet::full(FieldKind::Minute),
                ValueSet::full(FieldKind::Hour),
                ValueSet::full(FieldKind::DayOfMonth),
                ValueSet::full(FieldKind::Month),
                ValueSet::full(FieldKind::DayOfWeek),
                ValueSet::full(FieldKind::Year)};

  for (const auto& token : *tokens) {
    auto constraint = compile_field(token);
    if (!constraint) {
      auto failure = std::move(constraint.error());
      // Offsets are relative to the trimmed text; report them against the
      // caller's string unless a macro was substituted.
      if (expanded->data() == trimmed.data())
        failure.offset += static_cast<std::size_t>(trimmed.data() - expr.data());
      return std::unexpected{std::move(failure)};
    }
    fields[field_index(token.kind)] = std::move(*constraint);
  }

  return CronExpr(std::string(trimmed), std::move(fields));
}

auto CronExpr::next_after(TimePoint after, TimeZone zone) const
    -> std::optional<TimePoint> {
  auto civil = to_civil(after, zone);
  while (auto found = walker::next_after(*this, civil)) {
    // Skip wall-clock times that do not exist in the zone, and repeated
    // wall-clock times that resolve before `after`.
    if (auto tp = from_civil(*found, zone); tp && *tp > after)
      return tp;
    civil = *found;
  }
  return std::nullopt;
}

auto CronExpr::previous_before(TimePoint before, TimeZone zone) const
    -> std::optional<TimePoint> {
  auto civil = to_civil(before, zone);
  if (std::chrono::floor<std::chrono::seconds>(before) != before) {
    // `before` has a sub-second part, so its own second is still earlier.
    civil = shift_seconds(civil, 1);
  }
  while (auto found = walker::previous_before(*this, civil)) {
    if (auto tp = from_civil(*found, zone); tp && *tp < before)
      return tp;
    civil = *found;
  }
  return std::nullopt;
}

auto CronExpr::is_satisfied_by(TimePoint tp, TimeZone zone) const -> bool {
  return walker::matches(*this, to_civil(tp, zone));
}

auto CronExpr::all_between(TimePoint start, TimePoint end,
                           std::size_t max_count, TimeZone zone) const
    -> std::vector<TimePoint> {
  std::vector<TimePoint> result;
  result.reserve(std::min(max_count, std::size_t{64}));

  auto current = start - TimePoint::duration{1};
  while (result.size() < max_count) {
    auto next = next_after(current, zone);
    if (!next || *next >= end)
      break;
    result.push_back(*next);
    current = *next;
  }

  return result;
}

}  // namespace cronkit

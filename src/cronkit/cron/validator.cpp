#include "cronkit/cron/validator.hpp"

#include <variant>

namespace cronkit {

auto validate(std::string_view expr) -> ParseResult<void> {
  auto parsed = CronExpr::parse(expr);
  if (!parsed)
    return std::unexpected{std::move(parsed.error())};
  return {};
}

auto is_valid(std::string_view expr) -> bool {
  return validate(expr).has_value();
}

auto convention_warnings(const CronExpr& expr) -> std::vector<std::string> {
  std::vector<std::string> warnings;
  const auto& dom = expr.field(FieldKind::DayOfMonth);
  const auto& dow = expr.field(FieldKind::DayOfWeek);
  const bool dom_unset = std::holds_alternative<NoSpecificValue>(dom);
  const bool dow_unset = std::holds_alternative<NoSpecificValue>(dow);

  if (dom_unset && dow_unset) {
    warnings.emplace_back(
        "'?' is used for both day-of-month and day-of-week; every day "
        "matches");
  } else if (!dom_unset && !dow_unset) {
    if (expr.day_fields_ored()) {
      warnings.emplace_back(
          "day-of-month and day-of-week are both restricted; a day matches "
          "when either one does");
    } else {
      warnings.emplace_back(
          "neither day-of-month nor day-of-week uses '?'; conventionally one "
          "of them is '?'");
    }
  }
  return warnings;
}

}  // namespace cronkit

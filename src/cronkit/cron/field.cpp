#include "cronkit/cron/field.hpp"

#include "cronkit/cron/parse_failure.hpp"
#include "cronkit/util/strings.hpp"

namespace cronkit {

auto lookup_name(FieldKind kind, std::string_view token) noexcept
    -> std::optional<int> {
  if (kind == FieldKind::Month) {
    for (std::size_t i = 0; i < kMonthNames.size(); ++i) {
      if (strings::iequals(token, kMonthNames[i]))
        return static_cast<int>(i + 1);
    }
  } else if (kind == FieldKind::DayOfWeek) {
    for (std::size_t i = 0; i < kDowNames.size(); ++i) {
      if (strings::iequals(token, kDowNames[i]))
        return static_cast<int>(i + 1);
    }
  }
  return std::nullopt;
}

auto ParseFailure::message() const -> std::string {
  std::string out;
  if (field) {
    out.append(field_name(*field));
    out.append(" field at offset ");
  } else {
    out.append("at offset ");
  }
  out.append(std::to_string(offset));
  out.append(": ");
  out.append(detail.empty() ? code.message() : detail);
  return out;
}

}  // namespace cronkit

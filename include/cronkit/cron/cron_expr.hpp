#pragma once

#include "cronkit/cron/calendar.hpp"
#include "cronkit/cron/constraint.hpp"
#include "cronkit/cron/parse_failure.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cronkit {

// Compiled Quartz-style schedule:
//   second minute hour day-of-month month day-of-week [year]
// Immutable once parsed; safe to share between threads for reading.
class CronExpr {
public:
  using Fields = std::array<FieldConstraint, kFieldCount>;

  CronExpr() = default;

  [[nodiscard]] static auto parse(std::string_view expr)
      -> ParseResult<CronExpr>;

  [[nodiscard]] auto field(FieldKind kind) const noexcept
      -> const FieldConstraint& {
    return fields_[field_index(kind)];
  }

  [[nodiscard]] auto fields() const noexcept -> const Fields& {
    return fields_;
  }

  // Both day fields restricted: a date matches when either one does.
  [[nodiscard]] auto day_fields_ored() const noexcept -> bool {
    return day_fields_ored_;
  }

  [[nodiscard]] auto raw() const noexcept -> std::string_view {
    return raw_;
  }

  // First fire time strictly after `after`; nullopt past year 2099.
  [[nodiscard]] auto next_after(TimePoint after,
                                TimeZone zone = TimeZone::Utc) const
      -> std::optional<TimePoint>;

  // Last fire time strictly before `before`; nullopt before year 1970.
  [[nodiscard]] auto previous_before(TimePoint before,
                                     TimeZone zone = TimeZone::Utc) const
      -> std::optional<TimePoint>;

  [[nodiscard]] auto is_satisfied_by(TimePoint tp,
                                     TimeZone zone = TimeZone::Utc) const
      -> bool;

  // Fire times in [start, end), at most max_count of them.
  [[nodiscard]] auto all_between(TimePoint start, TimePoint end,
                                 std::size_t max_count = 1000,
                                 TimeZone zone = TimeZone::Utc) const
      -> std::vector<TimePoint>;

  // Equality compares compiled constraints, not the source text.
  friend auto operator==(const CronExpr& lhs, const CronExpr& rhs) -> bool {
    return lhs.fields_ == rhs.fields_;
  }

private:
  CronExpr(std::string raw, Fields fields);

  std::string raw_;
  Fields fields_{ValueSet::full(FieldKind::Second),
                 ValueSet::full(FieldKind::Minute),
                 ValueSet::full(FieldKind::Hour),
                 ValueSet::full(FieldKind::DayOfMonth),
                 ValueSet::full(FieldKind::Month),
                 ValueSet::full(FieldKind::DayOfWeek),
                 ValueSet::full(FieldKind::Year)};
  bool day_fields_ored_{false};
};

}  // namespace cronkit

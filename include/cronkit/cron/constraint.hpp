#pragma once

#include "cronkit/cron/field.hpp"

#include <bitset>
#include <optional>
#include <variant>
#include <vector>

namespace cronkit {

// Allowed values of one field, stored relative to the field minimum.
class ValueSet {
public:
  // Widest field is the year: 1970..2099.
  static constexpr std::size_t kCapacity = 130;

  explicit ValueSet(FieldKind kind = FieldKind::Second) : kind_(kind) {
  }

  [[nodiscard]] static auto full(FieldKind kind) -> ValueSet;

  [[nodiscard]] auto kind() const noexcept -> FieldKind {
    return kind_;
  }

  // Out-of-range values are ignored.
  auto add(int value) -> void;
  auto add_range(int first, int last, int step = 1) -> void;

  [[nodiscard]] auto test(int value) const noexcept -> bool;
  [[nodiscard]] auto empty() const noexcept -> bool {
    return bits_.none();
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return bits_.count();
  }
  [[nodiscard]] auto is_full() const noexcept -> bool;

  // Smallest member >= value / largest member <= value.
  [[nodiscard]] auto next_at_or_after(int value) const -> std::optional<int>;
  [[nodiscard]] auto prev_at_or_before(int value) const -> std::optional<int>;

  [[nodiscard]] auto values() const -> std::vector<int>;

  friend auto operator==(const ValueSet&, const ValueSet&) -> bool = default;

private:
  FieldKind kind_;
  std::bitset<kCapacity> bits_;
};

// `?` in day-of-month or day-of-week.
struct NoSpecificValue {
  friend auto operator==(const NoSpecificValue&, const NoSpecificValue&)
      -> bool = default;
};

// `L` / `L-n` in day-of-month: `offset` days before the last day.
struct LastDayOfMonth {
  int offset{0};
  friend auto operator==(const LastDayOfMonth&, const LastDayOfMonth&)
      -> bool = default;
};

// `LW` in day-of-month.
struct LastWeekdayOfMonth {
  friend auto operator==(const LastWeekdayOfMonth&, const LastWeekdayOfMonth&)
      -> bool = default;
};

// `dW` in day-of-month: Monday-Friday closest to `day`, same month only.
struct NearestWeekday {
  int day{1};
  friend auto operator==(const NearestWeekday&, const NearestWeekday&)
      -> bool = default;
};

// `d#n` in day-of-week.
struct NthDayOfWeek {
  int day_of_week{kSunday};
  int occurrence{1};
  friend auto operator==(const NthDayOfWeek&, const NthDayOfWeek&)
      -> bool = default;
};

// `dL` in day-of-week: last such weekday of the month.
struct LastDayOfWeek {
  int day_of_week{kSaturday};
  friend auto operator==(const LastDayOfWeek&, const LastDayOfWeek&)
      -> bool = default;
};

using FieldConstraint =
    std::variant<ValueSet, NoSpecificValue, LastDayOfMonth, LastWeekdayOfMonth,
                 NearestWeekday, NthDayOfWeek, LastDayOfWeek>;

template <typename... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

// A field is restricted unless it accepts every value (`*` or the full
// range) or carries `?`.
[[nodiscard]] auto is_restricted(const FieldConstraint& c) noexcept -> bool;

}  // namespace cronkit

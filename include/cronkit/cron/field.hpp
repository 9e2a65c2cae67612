#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace cronkit {

enum class FieldKind : std::uint8_t {
  Second,
  Minute,
  Hour,
  DayOfMonth,
  Month,
  DayOfWeek,
  Year,
};

inline constexpr std::size_t kFieldCount = 7;

// Static description of one positional field: valid range and the special
// characters it accepts beyond "* , - /".
struct FieldSpec {
  FieldKind kind;
  std::string_view name;
  int min;
  int max;
  bool allows_no_specific{false};  // ?
  bool allows_last{false};         // L
  bool allows_weekday{false};      // W
  bool allows_nth{false};          // #

  [[nodiscard]] constexpr auto span() const noexcept -> int {
    return max - min + 1;
  }

  [[nodiscard]] constexpr auto contains(int value) const noexcept -> bool {
    return value >= min && value <= max;
  }
};

inline constexpr std::array<FieldSpec, kFieldCount> kFieldSpecs{{
    {FieldKind::Second, "second", 0, 59},
    {FieldKind::Minute, "minute", 0, 59},
    {FieldKind::Hour, "hour", 0, 23},
    {FieldKind::DayOfMonth, "day-of-month", 1, 31, true, true, true, false},
    {FieldKind::Month, "month", 1, 12},
    {FieldKind::DayOfWeek, "day-of-week", 1, 7, true, true, false, true},
    {FieldKind::Year, "year", 1970, 2099},
}};

[[nodiscard]] constexpr auto field_spec(FieldKind kind) noexcept
    -> const FieldSpec& {
  return kFieldSpecs[static_cast<std::size_t>(kind)];
}

[[nodiscard]] constexpr auto field_name(FieldKind kind) noexcept
    -> std::string_view {
  return field_spec(kind).name;
}

[[nodiscard]] constexpr auto field_index(FieldKind kind) noexcept
    -> std::size_t {
  return static_cast<std::size_t>(kind);
}

inline constexpr int kMinYear = 1970;
inline constexpr int kMaxYear = 2099;

// Day-of-week numbering is 1=SUN .. 7=SAT.
inline constexpr int kSunday = 1;
inline constexpr int kSaturday = 7;

inline constexpr std::array<std::string_view, 12> kMonthNames{
    "JAN", "FEB", "MAR", "APR", "MAY", "JUN",
    "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};

inline constexpr std::array<std::string_view, 7> kDowNames{
    "SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"};

// Resolves a month or weekday abbreviation (case-insensitive) to its
// numeric value. Other fields have no names.
[[nodiscard]] auto lookup_name(FieldKind kind, std::string_view token) noexcept
    -> std::optional<int>;

}  // namespace cronkit

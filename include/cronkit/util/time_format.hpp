#pragma once

#include "cronkit/core/error.hpp"
#include "cronkit/cron/calendar.hpp"

#include <string>
#include <string_view>

namespace cronkit {

inline constexpr std::string_view kDefaultTimeFormat = "%Y-%m-%d %H:%M:%S";

// strftime-style rendering of an instant in the given zone. Stateless.
[[nodiscard]] auto format_time(TimePoint tp,
                               std::string_view pattern = kDefaultTimeFormat,
                               TimeZone zone = TimeZone::Utc) -> std::string;

// Accepts "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DDTHH:MM:SS" and "YYYY-MM-DD".
[[nodiscard]] auto parse_civil_time(std::string_view text)
    -> Result<CivilTime>;

[[nodiscard]] auto parse_time(std::string_view text,
                              TimeZone zone = TimeZone::Utc)
    -> Result<TimePoint>;

}  // namespace cronkit

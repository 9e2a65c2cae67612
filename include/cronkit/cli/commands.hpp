#pragma once

#include "cronkit/config/app_config.hpp"
#include "cronkit/core/error.hpp"
#include "cronkit/cron/calendar.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cronkit::cli {

struct OutputOptions {
  bool json{false};
  TimeZone zone{TimeZone::Local};
  std::string time_format{kDefaultTimeFormat};
  std::size_t cache_capacity{256};
};

struct ValidateOptions {
  std::vector<std::string> expressions;
  OutputOptions output;
};

struct FormatOptions {
  std::string expression;
  OutputOptions output;
};

struct NextOptions {
  std::string expression;
  std::string from;
  int count{1};
  OutputOptions output;
};

struct PrevOptions {
  std::string expression;
  std::string before;
  OutputOptions output;
};

struct MatchOptions {
  std::string expression;
  std::string time;
  OutputOptions output;
};

struct PlanOptions {
  std::vector<ScheduleEntry> schedules;
  std::string from;
  int count{5};
  OutputOptions output;
};

[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;
[[nodiscard]] auto cmd_format(const FormatOptions& opts) -> int;
[[nodiscard]] auto cmd_next(const NextOptions& opts) -> int;
[[nodiscard]] auto cmd_prev(const PrevOptions& opts) -> int;
[[nodiscard]] auto cmd_match(const MatchOptions& opts) -> int;
[[nodiscard]] auto cmd_plan(const PlanOptions& opts) -> int;

// Empty text means "now".
[[nodiscard]] auto resolve_time(std::string_view text, TimeZone zone)
    -> Result<std::optional<TimePoint>>;

// Prints the parse diagnostic for an expression the service rejected.
auto report_invalid(std::string_view expr) -> void;

}  // namespace cronkit::cli

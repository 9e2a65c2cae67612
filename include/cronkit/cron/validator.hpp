#pragma once

#include "cronkit/cron/cron_expr.hpp"
#include "cronkit/cron/parse_failure.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cronkit {

// Compiles and discards; reports the first structural or range violation.
[[nodiscard]] auto validate(std::string_view expr) -> ParseResult<void>;

[[nodiscard]] auto is_valid(std::string_view expr) -> bool;

// Soft-rule notes on the day-of-month / day-of-week pairing. These never
// make an expression invalid.
[[nodiscard]] auto convention_warnings(const CronExpr& expr)
    -> std::vector<std::string>;

}  // namespace cronkit

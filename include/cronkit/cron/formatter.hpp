#pragma once

#include "cronkit/cron/constraint.hpp"
#include "cronkit/cron/cron_expr.hpp"

#include <string>

namespace cronkit {

// Canonical seven-field rendering. Parsing the result yields an expression
// equal to `expr`.
[[nodiscard]] auto format(const CronExpr& expr) -> std::string;

[[nodiscard]] auto format_constraint(const FieldConstraint& constraint)
    -> std::string;

}  // namespace cronkit

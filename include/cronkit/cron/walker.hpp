#pragma once

#include "cronkit/cron/calendar.hpp"
#include "cronkit/cron/cron_expr.hpp"

#include <optional>

namespace cronkit::walker {

// Field-carry search over wall-clock components. The bounds are the year
// field's range, so every search terminates.

// Earliest matching time >= from.
[[nodiscard]] auto find_next(const CronExpr& expr, CivilTime from)
    -> std::optional<CivilTime>;

// Latest matching time <= from.
[[nodiscard]] auto find_previous(const CronExpr& expr, CivilTime from)
    -> std::optional<CivilTime>;

// Strictly after / strictly before; never returns `t` itself.
[[nodiscard]] auto next_after(const CronExpr& expr, const CivilTime& t)
    -> std::optional<CivilTime>;
[[nodiscard]] auto previous_before(const CronExpr& expr, const CivilTime& t)
    -> std::optional<CivilTime>;

[[nodiscard]] auto day_matches(const CronExpr& expr, int year, int month,
                               int day) -> bool;

// All seven fields agree with `t`, no search.
[[nodiscard]] auto matches(const CronExpr& expr, const CivilTime& t) -> bool;

}  // namespace cronkit::walker

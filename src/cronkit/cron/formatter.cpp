#include "cronkit/cron/formatter.hpp"

#include <cstddef>
#include <vector>

namespace cronkit {
namespace {

auto append_list(std::string& out, const std::vector<int>& values,
                 std::size_t first, std::size_t last) -> void {
  // Consecutive runs of three or more collapse to a-b.
  std::size_t i = first;
  while (i < last) {
    std::size_t j = i;
    while (j + 1 < last && values[j + 1] == values[j] + 1)
      ++j;
    if (!out.empty())
      out.push_back(',');
    if (j - i >= 2) {
      out += std::to_string(values[i]) + "-" + std::to_string(values[j]);
      i = j + 1;
    } else {
      out += std::to_string(values[i]);
      ++i;
    }
  }
}

// Common difference of the sequence, or 0 when it is not arithmetic.
auto common_step(const std::vector<int>& values) -> int {
  if (values.size() < 2)
    return 0;
  int step = values[1] - values[0];
  for (std::size_t i = 2; i < values.size(); ++i) {
    if (values[i] - values[i - 1] != step)
      return 0;
  }
  return step;
}

auto format_set(const ValueSet& set) -> std::string {
  if (set.is_full())
    return "*";

  const auto& spec = field_spec(set.kind());
  const auto values = set.values();
  const int step = common_step(values);

  if (step > 1) {
    const int first = values.front();
    const int last = values.back();
    if (last + step > spec.max) {
      // Sequence runs to the end of the field: a/step.
      return (first == spec.min ? std::string("*") : std::to_string(first)) +
             "/" + std::to_string(step);
    }
    if (values.size() >= 3) {
      return std::to_string(first) + "-" + std::to_string(last) + "/" +
             std::to_string(step);
    }
  }

  std::string out;
  append_list(out, values, 0, values.size());
  return out;
}

}  // namespace

auto format_constraint(const FieldConstraint& constraint) -> std::string {
  return std::visit(
      overloaded{
          [](const ValueSet& set) { return format_set(set); },
          [](const NoSpecificValue&) { return std::string("?"); },
          [](const LastDayOfMonth& c) {
            return c.offset == 0 ? std::string("L")
                                 : "L-" + std::to_string(c.offset);
          },
          [](const LastWeekdayOfMonth&) { return std::string("LW"); },
          [](const NearestWeekday& c) {
            return std::to_string(c.day) + "W";
          },
          [](const NthDayOfWeek& c) {
            return std::to_string(c.day_of_week) + "#" +
                   std::to_string(c.occurrence);
          },
          [](const LastDayOfWeek& c) {
            return std::to_string(c.day_of_week) + "L";
          },
      },
      constraint);
}

auto format(const CronExpr& expr) -> std::string {
  std::string out;
  for (const auto& constraint : expr.fields()) {
    if (!out.empty())
      out.push_back(' ');
    out += format_constraint(constraint);
  }
  return out;
}

}  // namespace cronkit

#include "cronkit/cli/commands.hpp"

#include "cronkit/cron/validator.hpp"
#include "cronkit/util/time_format.hpp"

#include <print>
#include <string>

namespace cronkit::cli {

auto resolve_time(std::string_view text, TimeZone zone)
    -> Result<std::optional<TimePoint>> {
  if (text.empty() || text == "now")
    return std::optional<TimePoint>{};
  auto tp = parse_time(text, zone);
  if (!tp) {
    std::println(stderr,
                 "Error: invalid time '{}' (expected YYYY-MM-DD HH:MM:SS)",
                 text);
    return fail(tp.error());
  }
  return std::optional<TimePoint>{*tp};
}

auto report_invalid(std::string_view expr) -> void {
  auto r = validate(expr);
  if (r) {
    return;
  }
  const auto& failure = r.error();
  std::println(stderr, "Error: {}", failure.message());
  std::println(stderr, "  {}", expr);
  if (failure.offset < expr.size()) {
    std::println(stderr, "  {}^", std::string(failure.offset, ' '));
  }
}

}  // namespace cronkit::cli

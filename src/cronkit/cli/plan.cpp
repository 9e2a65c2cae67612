#include "cronkit/cli/commands.hpp"
#include "cronkit/service/cron_service.hpp"
#include "cronkit/util/log.hpp"
#include "cronkit/util/time_format.hpp"

#include <nlohmann/json.hpp>

#include <print>

namespace cronkit::cli {

auto cmd_plan(const PlanOptions& opts) -> int {
  if (opts.schedules.empty()) {
    std::println(stderr, "Error: no schedules configured");
    return 1;
  }
  if (opts.count < 1) {
    std::println(stderr, "Error: count must be at least 1");
    return 2;
  }
  auto from = resolve_time(opts.from, opts.output.zone);
  if (!from)
    return 2;

  // Fix the reference time so every schedule is planned from the same point.
  auto start = from->value_or(Clock::now());
  CronService service({opts.output.zone, opts.output.cache_capacity});
  auto out = nlohmann::json::object();
  int failed = 0;

  for (const auto& entry : opts.schedules) {
    if (!entry.enabled) {
      log::debug("Skipping disabled schedule '{}'", entry.name);
      continue;
    }

    auto times = service.next_time_strs(entry.expression, start, opts.count,
                                        opts.output.time_format);
    if (!times) {
      failed++;
      log::warn("Schedule '{}' ({}): {}", entry.name, entry.expression,
                times.error().message());
      if (opts.output.json) {
        out[entry.name] = {{"expression", entry.expression},
                           {"error", times.error().message()}};
      } else {
        std::println("{} [{}]: {}", entry.name, entry.expression,
                     times.error().message());
      }
      continue;
    }

    if (opts.output.json) {
      out[entry.name] = {{"expression", entry.expression}, {"next", *times}};
    } else {
      std::println("{} [{}]", entry.name, entry.expression);
      for (const auto& t : *times) {
        std::println("  {}", t);
      }
    }
  }

  if (opts.output.json) {
    std::println("{}", out.dump(2));
  }
  return failed > 0 ? 1 : 0;
}

}  // namespace cronkit::cli

#include "cronkit/cli/commands.hpp"
#include "cronkit/service/cron_service.hpp"
#include "cronkit/util/log.hpp"
#include "cronkit/util/time_format.hpp"

#include <nlohmann/json.hpp>

#include <print>

namespace cronkit::cli {

namespace {

auto report_search_error(std::string_view expr, std::error_code ec) -> void {
  if (ec == Error::MalformedExpression) {
    report_invalid(expr);
  } else {
    std::println(stderr, "Error: {}", ec.message());
  }
}

}  // namespace

auto cmd_next(const NextOptions& opts) -> int {
  if (opts.count < 1) {
    std::println(stderr, "Error: count must be at least 1");
    return 2;
  }
  auto from = resolve_time(opts.from, opts.output.zone);
  if (!from)
    return 2;

  CronService service({opts.output.zone, opts.output.cache_capacity});
  auto times = service.next_times(opts.expression, *from, opts.count);
  if (!times) {
    report_search_error(opts.expression, times.error());
    return 1;
  }
  if (times->size() < static_cast<std::size_t>(opts.count)) {
    log::warn("'{}' fires only {} more time(s) before year {}",
              opts.expression, times->size(), kMaxYear + 1);
  }

  if (opts.output.json) {
    auto out = nlohmann::json::array();
    for (auto tp : *times) {
      out.push_back(format_time(tp, opts.output.time_format, opts.output.zone));
    }
    std::println("{}", out.dump(2));
  } else {
    for (auto tp : *times) {
      std::println("{}", format_time(tp, opts.output.time_format,
                                     opts.output.zone));
    }
  }
  return 0;
}

auto cmd_prev(const PrevOptions& opts) -> int {
  auto before = resolve_time(opts.before, opts.output.zone);
  if (!before)
    return 2;

  CronService service({opts.output.zone, opts.output.cache_capacity});
  auto prev = service.previous_time_str(opts.expression, *before,
                                        opts.output.time_format);
  if (!prev) {
    report_search_error(opts.expression, prev.error());
    return 1;
  }

  if (opts.output.json) {
    nlohmann::json out{{"expression", opts.expression}, {"previous", *prev}};
    std::println("{}", out.dump(2));
  } else {
    std::println("{}", *prev);
  }
  return 0;
}

auto cmd_match(const MatchOptions& opts) -> int {
  auto tp = parse_time(opts.time, opts.output.zone);
  if (!tp) {
    std::println(stderr,
                 "Error: invalid time '{}' (expected YYYY-MM-DD HH:MM:SS)",
                 opts.time);
    return 2;
  }

  CronService service({opts.output.zone, opts.output.cache_capacity});
  auto satisfied = service.is_satisfied_by(opts.expression, *tp);
  if (!satisfied) {
    report_search_error(opts.expression, satisfied.error());
    return 2;
  }

  if (opts.output.json) {
    nlohmann::json out{{"expression", opts.expression},
                       {"time", opts.time},
                       {"matches", *satisfied}};
    std::println("{}", out.dump(2));
  } else {
    std::println("{}", *satisfied ? "yes" : "no");
  }
  return *satisfied ? 0 : 1;
}

}  // namespace cronkit::cli

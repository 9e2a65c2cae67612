#include "cronkit/cli/commands.hpp"
#include "cronkit/cron/cron_expr.hpp"
#include "cronkit/cron/formatter.hpp"
#include "cronkit/cron/validator.hpp"
#include "cronkit/service/cron_service.hpp"

#include <nlohmann/json.hpp>

#include <print>

namespace cronkit::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  if (opts.expressions.empty()) {
    std::println(stderr, "Error: validate requires at least one expression");
    return 2;
  }

  int invalid_count = 0;
  auto results = nlohmann::json::array();

  for (const auto& expr : opts.expressions) {
    auto parsed = CronExpr::parse(expr);
    if (!parsed) {
      invalid_count++;
      if (opts.output.json) {
        const auto& failure = parsed.error();
        nlohmann::json entry{{"expression", expr},
                             {"valid", false},
                             {"offset", failure.offset},
                             {"error", failure.message()}};
        if (failure.field)
          entry["field"] = std::string(field_name(*failure.field));
        results.push_back(std::move(entry));
      } else {
        std::println("\u2717 {} - {}", expr, parsed.error().message());
      }
      continue;
    }

    auto warnings = convention_warnings(*parsed);
    if (opts.output.json) {
      results.push_back({{"expression", expr},
                         {"valid", true},
                         {"canonical", format(*parsed)},
                         {"warnings", warnings}});
    } else {
      std::println("\u2713 {} - Valid ({})", expr, format(*parsed));
      for (const auto& w : warnings) {
        std::println("    note: {}", w);
      }
    }
  }

  if (opts.output.json) {
    std::println("{}", results.dump(2));
  } else if (opts.expressions.size() > 1) {
    std::println("\nSummary: {} valid, {} invalid out of {} expressions",
                 opts.expressions.size() - static_cast<std::size_t>(invalid_count),
                 invalid_count, opts.expressions.size());
  }

  return invalid_count > 0 ? 1 : 0;
}

auto cmd_format(const FormatOptions& opts) -> int {
  CronService service({opts.output.zone, opts.output.cache_capacity});
  auto canonical = service.format_expression(opts.expression);
  if (!canonical) {
    report_invalid(opts.expression);
    return 1;
  }
  if (opts.output.json) {
    nlohmann::json out{{"expression", opts.expression},
                       {"canonical", *canonical}};
    std::println("{}", out.dump(2));
  } else {
    std::println("{}", *canonical);
  }
  return 0;
}

}  // namespace cronkit::cli

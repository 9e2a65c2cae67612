#include "cronkit/service/cron_service.hpp"

#include "cronkit/cron/formatter.hpp"
#include "cronkit/util/log.hpp"

#include <mutex>

namespace cronkit {

CronService::CronService(ServiceConfig config) : config_(config) {
  if (config_.cache_capacity == 0)
    config_.cache_capacity = 1;
}

auto CronService::compile(std::string_view expr)
    -> Result<std::shared_ptr<const CronExpr>> {
  {
    std::shared_lock lock(mu_);
    if (auto it = cache_.find(expr); it != cache_.end())
      return it->second;
  }

  auto parsed = CronExpr::parse(expr);
  if (!parsed) {
    log::debug("Rejected cron expression '{}': {}", expr,
               parsed.error().message());
    return fail(parsed.error().code);
  }
  auto compiled = std::make_shared<const CronExpr>(std::move(*parsed));

  std::unique_lock lock(mu_);
  if (cache_.size() >= config_.cache_capacity) {
    log::trace("Expression cache full ({} entries), clearing", cache_.size());
    cache_.clear();
  }
  auto it = cache_.try_emplace(std::string(expr), compiled).first;
  return it->second;
}

auto CronService::is_valid_expression(std::string_view expr) -> bool {
  return compile(expr).has_value();
}

auto CronService::format_expression(std::string_view expr)
    -> Result<std::string> {
  auto compiled = compile(expr);
  if (!compiled)
    return fail(compiled.error());
  return format(**compiled);
}

auto CronService::next_time(std::string_view expr,
                            std::optional<TimePoint> from)
    -> Result<TimePoint> {
  auto compiled = compile(expr);
  if (!compiled)
    return fail(compiled.error());

  auto start = from.value_or(Clock::now());
  auto next = (*compiled)->next_after(start, config_.zone);
  if (!next) {
    log::debug("No fire time for '{}' after {}", expr,
               format_time(start, kDefaultTimeFormat, config_.zone));
    return fail(Error::Exhausted);
  }
  return *next;
}

auto CronService::next_times(std::string_view expr,
                             std::optional<TimePoint> from, int count)
    -> Result<std::vector<TimePoint>> {
  if (count < 1)
    return fail(Error::InvalidArgument);

  auto compiled = compile(expr);
  if (!compiled)
    return fail(compiled.error());

  std::vector<TimePoint> times;
  times.reserve(static_cast<std::size_t>(count));
  auto cursor = from.value_or(Clock::now());
  for (int i = 0; i < count; ++i) {
    auto next = (*compiled)->next_after(cursor, config_.zone);
    if (!next)
      break;
    times.push_back(*next);
    cursor = *next;
  }
  if (times.empty())
    return fail(Error::Exhausted);
  return times;
}

auto CronService::previous_time(std::string_view expr,
                                std::optional<TimePoint> before)
    -> Result<TimePoint> {
  auto compiled = compile(expr);
  if (!compiled)
    return fail(compiled.error());

  auto prev = (*compiled)->previous_before(before.value_or(Clock::now()),
                                           config_.zone);
  if (!prev)
    return fail(Error::Exhausted);
  return *prev;
}

auto CronService::is_satisfied_by(std::string_view expr, TimePoint tp)
    -> Result<bool> {
  auto compiled = compile(expr);
  if (!compiled)
    return fail(compiled.error());
  return (*compiled)->is_satisfied_by(tp, config_.zone);
}

auto CronService::next_time_str(std::string_view expr,
                                std::optional<TimePoint> from,
                                std::string_view pattern)
    -> Result<std::string> {
  auto next = next_time(expr, from);
  if (!next)
    return fail(next.error());
  return format_time(*next, pattern, config_.zone);
}

auto CronService::next_time_strs(std::string_view expr,
                                 std::optional<TimePoint> from, int count,
                                 std::string_view pattern)
    -> Result<std::vector<std::string>> {
  auto times = next_times(expr, from, count);
  if (!times)
    return fail(times.error());
  std::vector<std::string> out;
  out.reserve(times->size());
  for (auto tp : *times) {
    out.push_back(format_time(tp, pattern, config_.zone));
  }
  return out;
}

auto CronService::previous_time_str(std::string_view expr,
                                    std::optional<TimePoint> before,
                                    std::string_view pattern)
    -> Result<std::string> {
  auto prev = previous_time(expr, before);
  if (!prev)
    return fail(prev.error());
  return format_time(*prev, pattern, config_.zone);
}

auto CronService::cache_size() const -> std::size_t {
  std::shared_lock lock(mu_);
  return cache_.size();
}

auto CronService::clear_cache() -> void {
  std::unique_lock lock(mu_);
  cache_.clear();
}

}  // namespace cronkit

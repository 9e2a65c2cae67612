#pragma once

#include "cronkit/core/error.hpp"
#include "cronkit/cron/calendar.hpp"
#include "cronkit/cron/cron_expr.hpp"
#include "cronkit/util/time_format.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cronkit {

struct ServiceConfig {
  TimeZone zone{TimeZone::Local};
  std::size_t cache_capacity{256};
};

// Convenience layer over the engine: every call takes the schedule as text
// and compiles it through a cache shared by all callers.
class CronService {
public:
  explicit CronService(ServiceConfig config = {});
  ~CronService() = default;

  CronService(const CronService&) = delete;
  auto operator=(const CronService&) -> CronService& = delete;
  CronService(CronService&&) = delete;
  auto operator=(CronService&&) -> CronService& = delete;

  [[nodiscard]] auto compile(std::string_view expr)
      -> Result<std::shared_ptr<const CronExpr>>;

  [[nodiscard]] auto is_valid_expression(std::string_view expr) -> bool;
  [[nodiscard]] auto format_expression(std::string_view expr)
      -> Result<std::string>;

  // `from` defaults to the current time.
  [[nodiscard]] auto next_time(std::string_view expr,
                               std::optional<TimePoint> from = std::nullopt)
      -> Result<TimePoint>;

  // Each result seeds the next search. Fewer than `count` entries when the
  // schedule runs out before year 2099.
  [[nodiscard]] auto next_times(std::string_view expr,
                                std::optional<TimePoint> from, int count)
      -> Result<std::vector<TimePoint>>;

  [[nodiscard]] auto previous_time(std::string_view expr,
                                   std::optional<TimePoint> before = std::nullopt)
      -> Result<TimePoint>;

  [[nodiscard]] auto is_satisfied_by(std::string_view expr, TimePoint tp)
      -> Result<bool>;

  [[nodiscard]] auto next_time_str(std::string_view expr,
                                   std::optional<TimePoint> from = std::nullopt,
                                   std::string_view pattern = kDefaultTimeFormat)
      -> Result<std::string>;
  [[nodiscard]] auto next_time_strs(std::string_view expr,
                                    std::optional<TimePoint> from, int count,
                                    std::string_view pattern = kDefaultTimeFormat)
      -> Result<std::vector<std::string>>;
  [[nodiscard]] auto previous_time_str(
      std::string_view expr, std::optional<TimePoint> before = std::nullopt,
      std::string_view pattern = kDefaultTimeFormat) -> Result<std::string>;

  [[nodiscard]] auto zone() const noexcept -> TimeZone {
    return config_.zone;
  }
  [[nodiscard]] auto cache_size() const -> std::size_t;
  auto clear_cache() -> void;

private:
  ServiceConfig config_;
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<const CronExpr>, StringHash,
                     StringEqual>
      cache_;
};

}  // namespace cronkit

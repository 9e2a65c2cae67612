#pragma once

#include "cronkit/cron/calendar.hpp"
#include "cronkit/util/time_format.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cronkit {

struct LogConfig {
  std::string level{"warn"};
  std::string file;
};

struct ScheduleDefaults {
  TimeZone time_zone{TimeZone::Local};
  std::string time_format{kDefaultTimeFormat};
  int preview_count{5};
};

struct CacheConfig {
  std::size_t capacity{256};
};

// A named schedule listed in the configuration file, used by `plan`.
struct ScheduleEntry {
  std::string name;
  std::string expression;
  bool enabled{true};
};

struct AppConfig {
  LogConfig log;
  ScheduleDefaults defaults;
  CacheConfig cache;
  std::vector<ScheduleEntry> schedules;
};

}  // namespace cronkit

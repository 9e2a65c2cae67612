#include "cronkit/config/config.hpp"

#include "cronkit/config/yaml_utils.hpp"
#include "cronkit/cron/validator.hpp"
#include "cronkit/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<cronkit::LogConfig> {
  static bool decode(const Node& node, cronkit::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = cronkit::yaml_get_or<std::string>(node, "level", "warn");
    l.file = cronkit::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<cronkit::ScheduleDefaults> {
  static bool decode(const Node& node, cronkit::ScheduleDefaults& d) {
    if (!node.IsMap()) {
      return false;
    }
    auto zone_str = cronkit::yaml_get_or<std::string>(node, "time_zone", "local");
    auto zone = cronkit::parse_time_zone(zone_str);
    if (!zone) {
      return false;
    }
    d.time_zone = *zone;
    d.time_format = cronkit::yaml_get_or<std::string>(
        node, "time_format", std::string(cronkit::kDefaultTimeFormat));
    d.preview_count = cronkit::yaml_get_or(node, "preview_count", 5);
    return d.preview_count >= 1 && !d.time_format.empty();
  }
};

template <>
struct convert<cronkit::CacheConfig> {
  static bool decode(const Node& node, cronkit::CacheConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    c.capacity = cronkit::yaml_get_or<std::size_t>(node, "capacity", 256);
    return c.capacity > 0;
  }
};

template <>
struct convert<cronkit::ScheduleEntry> {
  static bool decode(const Node& node, cronkit::ScheduleEntry& s) {
    if (!node.IsMap() || !node["name"] || !node["expression"]) {
      return false;
    }
    s.name = node["name"].as<std::string>();
    s.expression = node["expression"].as<std::string>();
    s.enabled = cronkit::yaml_get_or(node, "enabled", true);
    return true;
  }
};

template <>
struct convert<cronkit::AppConfig> {
  static bool decode(const Node& node, cronkit::AppConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto log = node["log"]) {
      c.log = log.as<cronkit::LogConfig>();
    }
    if (auto defaults = node["defaults"]) {
      c.defaults = defaults.as<cronkit::ScheduleDefaults>();
    }
    if (auto cache = node["cache"]) {
      c.cache = cache.as<cronkit::CacheConfig>();
    }
    if (auto schedules = node["schedules"]) {
      c.schedules = schedules.as<std::vector<cronkit::ScheduleEntry>>();
    }
    return true;
  }
};

}  // namespace YAML

namespace cronkit {

namespace {

auto check_schedules(const AppConfig& config) -> Result<void> {
  for (const auto& entry : config.schedules) {
    if (auto r = validate(entry.expression); !r) {
      log::error("Schedule '{}' has an invalid expression: {}", entry.name,
                 r.error().message());
      return fail(Error::ConfigError);
    }
  }
  return ok();
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path) -> Result<AppConfig> {
  std::string path_str{path};
  std::error_code ec;
  if (!std::filesystem::exists(path_str, ec)) {
    log::error("Config file not found: {}", path);
    return fail(Error::FileNotFound);
  }
  std::ifstream file(path_str);
  if (std::filesystem::is_directory(path_str, ec) || !file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileOpenFailed);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<AppConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ConfigError);
    }
    AppConfig config = root.as<AppConfig>();
    if (auto r = check_schedules(config); !r) {
      return fail(r.error());
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ConfigError);
  }
}

}  // namespace cronkit

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include <unistd.h>

namespace cronkit::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info",
                                        "warn",  "error", "off"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m",  // error: red
      ""           // off
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn" || name == "warning")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  if (name == "off")
    return Level::Off;
  return Level::Info;
}

// Synchronous logger writing to stderr or a file. Writes are serialized.
class Logger {
  std::atomic<Level> level_{Level::Warn};
  std::mutex mu_;
  std::FILE* sink_{stderr};
  bool owns_sink_{false};
  bool color_{false};

public:
  Logger() : color_(isatty(fileno(stderr)) != 0) {
  }

  ~Logger() {
    close_file();
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= level_.load(std::memory_order_acquire) &&
           level != Level::Off;
  }

  // Appends to `path`; keeps the current sink when it cannot be opened.
  [[nodiscard]] auto set_file(const std::string& path) -> bool {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (!f)
      return false;
    std::lock_guard lock(mu_);
    if (owns_sink_)
      std::fclose(sink_);
    sink_ = f;
    owns_sink_ = true;
    color_ = false;
    return true;
  }

  auto close_file() -> void {
    std::lock_guard lock(mu_);
    if (owns_sink_) {
      std::fclose(sink_);
      sink_ = stderr;
      owns_sink_ = false;
    }
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (!enabled(level))
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    std::lock_guard lock(mu_);
    std::string line;
    if (color_) {
      line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\033[0m] [{}] {}\n",
                         time, level_color(level), level_name(level), tid,
                         std::format(fmt, std::forward<Args>(args)...));
    } else {
      line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                         level_name(level), tid,
                         std::format(fmt, std::forward<Args>(args)...));
    }
    std::fputs(line.c_str(), sink_);
    std::fflush(sink_);
  }
};

// Global logger instance
inline Logger& logger() {
  static Logger instance;
  return instance;
}

// Public API
inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

[[nodiscard]] inline auto set_file(const std::string& path) -> bool {
  return logger().set_file(path);
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace cronkit::log

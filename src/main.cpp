#include "cronkit/cli/commands.hpp"
#include "cronkit/config/config.hpp"
#include "cronkit/util/log.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog) {
  std::println("cronkit - Quartz-style cron expression toolkit");
  std::println("Usage: {} [OPTIONS] <command> [ARGS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  validate <expr>...            Check expressions and show "
               "their canonical form");
  std::println("  format <expr>                 Print the canonical form");
  std::println("  next <expr> [-n N] [--from T] Next N fire times");
  std::println("  prev <expr> [--before T]      Most recent fire time");
  std::println("  match <expr> <time>           Exit 0 if the time fires");
  std::println("  plan [-n N] [--from T]        Preview configured schedules");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --utc                 Evaluate in UTC");
  std::println("  --local               Evaluate in the system time zone");
  std::println("  --time-format <fmt>   strftime pattern for printed times");
  std::println("  --json                Print results as JSON");
  std::println("  --log-level <level>   trace|debug|info|warn|error|off");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Times are written as YYYY-MM-DD HH:MM:SS (or 'now').");
  std::println("");
  std::println("Examples:");
  std::println("  {} validate \"0 15 10 ? * MON-FRI\"", prog);
  std::println("  {} next \"0 0 12 ? * 6L\" -n 3 --utc", prog);
  std::println("  {} -c schedules.yaml plan", prog);
}

void print_version() {
  std::println("cronkit v0.1.0");
}

struct Options {
  std::string config_file;
  std::string command;
  std::vector<std::string> args;
  std::string from;
  std::string before;
  std::string time_format;
  std::string log_level;
  std::optional<cronkit::TimeZone> zone;
  std::optional<int> count;
  bool json = false;
};

auto require_value(int& i, int argc, char* argv[], std::string_view name)
    -> std::string {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", name);
    std::exit(2);
  }
  return argv[i];
}

auto parse_count(std::string_view text) -> int {
  int n = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
  if (ec != std::errc{} || ptr != text.data() + text.size() || n < 1) {
    std::println(stderr, "Error: invalid count '{}'", text);
    std::exit(2);
  }
  return n;
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, "--config");
    } else if (arg == "--utc") {
      opts.zone = cronkit::TimeZone::Utc;
    } else if (arg == "--local") {
      opts.zone = cronkit::TimeZone::Local;
    } else if (arg == "--json") {
      opts.json = true;
    } else if (arg == "--time-format") {
      opts.time_format = require_value(i, argc, argv, "--time-format");
    } else if (arg == "--log-level") {
      opts.log_level = require_value(i, argc, argv, "--log-level");
    } else if (arg == "-n" || arg == "--count") {
      opts.count = parse_count(require_value(i, argc, argv, "--count"));
    } else if (arg == "--from") {
      opts.from = require_value(i, argc, argv, "--from");
    } else if (arg == "--before") {
      opts.before = require_value(i, argc, argv, "--before");
    } else if (arg.size() > 1 && arg.front() == '-' && arg != "-") {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(2);
    } else if (opts.command.empty()) {
      opts.command = arg;
    } else {
      opts.args.emplace_back(arg);
    }
  }

  return opts;
}

auto load_config(const Options& opts) -> cronkit::Result<cronkit::AppConfig> {
  if (opts.config_file.empty())
    return cronkit::AppConfig{};

  if (!std::filesystem::exists(opts.config_file)) {
    std::println(stderr, "Error: Config file not found: {}", opts.config_file);
    return cronkit::fail(cronkit::Error::FileNotFound);
  }
  auto config = cronkit::ConfigLoader::load_from_file(opts.config_file);
  if (!config) {
    std::println(stderr, "Error: Failed to load config: {}",
                 config.error().message());
  }
  return config;
}

void setup_logging(const cronkit::LogConfig& config,
                   const std::string& override_level) {
  cronkit::log::set_level(override_level.empty() ? config.level
                                                 : override_level);
  if (!config.file.empty() && !cronkit::log::set_file(config.file)) {
    cronkit::log::warn("Cannot open log file {}, logging to stderr",
                       config.file);
  }
}

auto require_expression(const Options& opts, std::size_t n) -> bool {
  if (opts.args.size() != n) {
    std::println(stderr, "Error: '{}' expects {} argument(s), got {}",
                 opts.command, n, opts.args.size());
    return false;
  }
  return true;
}

auto run(const Options& opts, const cronkit::AppConfig& config) -> int {
  namespace cli = cronkit::cli;

  cli::OutputOptions output;
  output.json = opts.json;
  output.zone = opts.zone.value_or(config.defaults.time_zone);
  output.time_format = opts.time_format.empty() ? config.defaults.time_format
                                                : opts.time_format;
  output.cache_capacity = config.cache.capacity;

  if (opts.command == "validate") {
    return cli::cmd_validate({opts.args, output});
  }
  if (opts.command == "format") {
    if (!require_expression(opts, 1))
      return 2;
    return cli::cmd_format({opts.args[0], output});
  }
  if (opts.command == "next") {
    if (!require_expression(opts, 1))
      return 2;
    return cli::cmd_next(
        {opts.args[0], opts.from, opts.count.value_or(1), output});
  }
  if (opts.command == "prev") {
    if (!require_expression(opts, 1))
      return 2;
    return cli::cmd_prev({opts.args[0], opts.before, output});
  }
  if (opts.command == "match") {
    if (!require_expression(opts, 2))
      return 2;
    return cli::cmd_match({opts.args[0], opts.args[1], output});
  }
  if (opts.command == "plan") {
    return cli::cmd_plan(
        {config.schedules, opts.from,
         opts.count.value_or(config.defaults.preview_count), output});
  }

  std::println(stderr, "Unknown command: {}", opts.command);
  return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  if (opts.command.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  auto config = load_config(opts);
  if (!config) {
    return 1;
  }

  setup_logging(config->log, opts.log_level);
  cronkit::log::debug("Running '{}' with {} argument(s)", opts.command,
                      opts.args.size());
  return run(opts, *config);
}

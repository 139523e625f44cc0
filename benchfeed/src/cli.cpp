#include "benchfeed/cli.hpp"
#include <charconv>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace benchfeed {

void printUsage(std::ostream &out) {
  out << R"(
Usage: benchfeed --publish-time <UNIX> [OPTIONS]

Fetch historical verified price feeds and their update data.

Options:
  --publish-time <UNIX>  Publish time to fetch (seconds since epoch)
  --id <HEX>             Price feed id, 64 hex digits (repeatable)
  --endpoint <URL>       Benchmarks base URL (overrides BENCHMARKS_ENDPOINT)
  --strict-alignment     Require one binary item per parsed feed
  --log-level <LEVEL>    trace|debug|info|warn|error|off (default: info)
  --help, -h             Show this help

Environment:
  BENCHMARKS_ENDPOINT    Benchmarks base URL, e.g. https://benchmarks.pyth.network
  BENCHFEED_LOG_LEVEL    Default log level
)";
}

UnixTimestamp parsePublishTime(const std::string &s) {
  UnixTimestamp value = 0;
  auto res = std::from_chars(s.data(), s.data() + s.size(), value);
  if (s.empty() || res.ec != std::errc() || res.ptr != s.data() + s.size())
    throw std::invalid_argument("--publish-time must be a decimal integer: " +
                                s);
  return value;
}

// from_str maps unknown names to off
void checkLogLevel(const std::string &name) {
  if (spdlog::level::from_str(name) == spdlog::level::off && name != "off")
    throw std::invalid_argument("unknown log level: " + name);
}

// ── Parse CLI args ──────────────────────────────────────────────────
CliArgs parseArgs(int argc, char *argv[]) {
  CliArgs args;

  // Load from environment
  if (auto *v = std::getenv("BENCHMARKS_ENDPOINT"))
    args.config.benchmarks_endpoint = std::string(v);
  if (auto *v = std::getenv("BENCHFEED_LOG_LEVEL"))
    args.config.log_level = v;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "--publish-time" && i + 1 < argc)
      args.publish_time = parsePublishTime(argv[++i]);
    else if (arg == "--id" && i + 1 < argc)
      args.price_ids.push_back(PriceIdentifier::fromHex(argv[++i]));
    else if (arg == "--endpoint" && i + 1 < argc)
      args.config.benchmarks_endpoint = std::string(argv[++i]);
    else if (arg == "--strict-alignment")
      args.config.alignment_check = AlignmentCheck::EQUAL_COUNT;
    else if (arg == "--log-level" && i + 1 < argc)
      args.config.log_level = argv[++i];
    else if (arg == "--help" || arg == "-h") {
      args.show_help = true;
      return args;
    } else
      throw std::invalid_argument("unknown or incomplete option: " + arg);
  }

  if (!args.publish_time)
    throw std::invalid_argument("--publish-time is required");
  checkLogLevel(args.config.log_level);
  return args;
}

} // namespace benchfeed

#pragma once
#include "benchfeed/common.hpp"
#include "benchfeed/price_feed.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace benchfeed {

struct CliArgs {
  Config config;
  std::optional<UnixTimestamp> publish_time;
  std::vector<PriceIdentifier> price_ids;
  bool show_help = false;
};

void printUsage(std::ostream &out);

// Environment first (BENCHMARKS_ENDPOINT, BENCHFEED_LOG_LEVEL), then argv.
// Throws std::invalid_argument on malformed input.
CliArgs parseArgs(int argc, char *argv[]);

// Whole string must be a decimal integer.
UnixTimestamp parsePublishTime(const std::string &s);

// Throws std::invalid_argument for names spdlog does not know.
void checkLogLevel(const std::string &name);

} // namespace benchfeed

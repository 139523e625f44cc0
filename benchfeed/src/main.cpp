#include "benchfeed/benchmarks.hpp"
#include "benchfeed/cli.hpp"
#include "benchfeed/errors.hpp"
#include "benchfeed/http_client.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <stdexcept>

using namespace benchfeed;

int main(int argc, char *argv[]) {
  // Setup logging; stdout carries only the result JSON
  auto console = spdlog::stderr_color_mt("benchfeed");
  spdlog::set_default_logger(console);
  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  CliArgs args;
  try {
    args = parseArgs(argc, argv);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    printUsage(std::cerr);
    return 2;
  }
  if (args.show_help) {
    printUsage(std::cout);
    return 0;
  }
  spdlog::set_level(spdlog::level::from_str(args.config.log_level));

  spdlog::info("Endpoint: {}", args.config.benchmarks_endpoint
                                   ? *args.config.benchmarks_endpoint
                                   : "❌ missing");

  CurlHttpClient http;
  BenchmarksClient benchmarks(args.config, http);

  try {
    auto result =
        benchmarks.getVerifiedPriceFeeds(args.price_ids, *args.publish_time);
    nlohmann::json out = result;
    std::cout << out.dump(2) << std::endl;
  } catch (const BenchmarksError &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
  return 0;
}

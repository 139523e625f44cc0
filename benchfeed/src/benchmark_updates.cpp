#include "benchfeed/benchmark_updates.hpp"
#include "benchfeed/errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace benchfeed {

void from_json(const json &j, BenchmarkUpdates &u) {
  u.parsed = j.at("parsed").get<std::vector<PriceFeed>>();
  u.binary = j.at("binary").get<BinaryBlob>();
}

BenchmarkUpdates parseBenchmarkUpdates(const std::string &body) {
  try {
    return json::parse(body).get<BenchmarkUpdates>();
  } catch (const json::exception &e) {
    throw SchemaError(e.what());
  } catch (const std::invalid_argument &e) {
    throw SchemaError(e.what());
  }
}

PriceFeedsWithUpdateData assemble(BenchmarkUpdates updates,
                                  AlignmentCheck check) {
  if (updates.parsed.size() != updates.binary.data.size()) {
    if (check == AlignmentCheck::EQUAL_COUNT)
      throw SchemaError("parsed has " + std::to_string(updates.parsed.size()) +
                        " feeds but binary has " +
                        std::to_string(updates.binary.data.size()) + " items");
    spdlog::debug("[Benchmarks] {} parsed feeds, {} binary items",
                  updates.parsed.size(), updates.binary.data.size());
  }

  PriceFeedsWithUpdateData result;
  result.update_data = decodeBlob(updates.binary);

  result.price_feeds.reserve(updates.parsed.size());
  for (auto &feed : updates.parsed) {
    PriceFeedUpdate update;
    update.price_feed = std::move(feed);
    // Benchmarks does not report these yet
    update.slot = std::nullopt;
    update.received_at = std::nullopt;
    update.update_data = std::nullopt;
    update.prev_publish_time = std::nullopt;
    result.price_feeds.push_back(std::move(update));
  }
  return result;
}

} // namespace benchfeed

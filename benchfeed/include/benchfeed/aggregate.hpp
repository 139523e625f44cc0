#pragma once
#include "benchfeed/common.hpp"
#include "benchfeed/price_feed.hpp"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <vector>

namespace benchfeed {

// One feed in an update batch. The optional fields are left empty when
// the source does not report them.
struct PriceFeedUpdate {
  PriceFeed price_feed;
  std::optional<Slot> slot;
  std::optional<UnixTimestamp> received_at;
  std::optional<Bytes> update_data;
  std::optional<UnixTimestamp> prev_publish_time;
};

// Parsed feeds plus the signed update messages that prove them. The
// update messages are not yet signature-verified.
struct PriceFeedsWithUpdateData {
  std::vector<PriceFeedUpdate> price_feeds;
  std::vector<Bytes> update_data;
};

// Absent optionals are written as null; bytes as lowercase hex.
void to_json(nlohmann::json &j, const PriceFeedUpdate &u);
void to_json(nlohmann::json &j, const PriceFeedsWithUpdateData &d);

} // namespace benchfeed

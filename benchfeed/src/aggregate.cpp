#include "benchfeed/aggregate.hpp"
#include "benchfeed/encoding.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace benchfeed {

template <typename T> static json optionalToJson(const std::optional<T> &v) {
  return v ? json(*v) : json(nullptr);
}

void to_json(json &j, const PriceFeedUpdate &u) {
  j = json{{"price_feed", u.price_feed},
           {"slot", optionalToJson(u.slot)},
           {"received_at", optionalToJson(u.received_at)},
           {"update_data",
            u.update_data ? json(hexEncode(*u.update_data)) : json(nullptr)},
           {"prev_publish_time", optionalToJson(u.prev_publish_time)}};
}

void to_json(json &j, const PriceFeedsWithUpdateData &d) {
  json updates = json::array();
  for (const auto &bytes : d.update_data)
    updates.push_back(hexEncode(bytes));
  j = json{{"price_feeds", d.price_feeds}, {"update_data", updates}};
}

} // namespace benchfeed

#pragma once
#include "benchfeed/aggregate.hpp"
#include "benchfeed/common.hpp"
#include "benchfeed/http_client.hpp"
#include "benchfeed/price_feed.hpp"
#include <string>
#include <vector>

namespace benchfeed {

// Historical verified price feeds, e.g. from the Pyth Benchmarks API.
class Benchmarks {
public:
  virtual ~Benchmarks() = default;

  // Throws ConfigurationError, TransportError, SchemaError or DecodeError.
  virtual PriceFeedsWithUpdateData
  getVerifiedPriceFeeds(const std::vector<PriceIdentifier> &price_ids,
                        UnixTimestamp publish_time) = 0;
};

class BenchmarksClient : public Benchmarks {
public:
  BenchmarksClient(const Config &config, HttpClient &http);

  PriceFeedsWithUpdateData
  getVerifiedPriceFeeds(const std::vector<PriceIdentifier> &price_ids,
                        UnixTimestamp publish_time) override;

  // The GET issued for a fetch. Throws ConfigurationError when no usable
  // endpoint is configured.
  HttpRequest buildRequest(const std::vector<PriceIdentifier> &price_ids,
                           UnixTimestamp publish_time) const;

private:
  Config config_;
  HttpClient &http_;
};

// scheme://authority of `endpoint` followed by the absolute `path`.
std::string joinEndpoint(const std::string &endpoint, const std::string &path);

} // namespace benchfeed

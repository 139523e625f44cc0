#include "benchfeed/benchmarks.hpp"
#include "benchfeed/benchmark_updates.hpp"
#include "benchfeed/errors.hpp"
#include <spdlog/spdlog.h>

namespace benchfeed {

std::string joinEndpoint(const std::string &endpoint,
                         const std::string &path) {
  auto scheme_end = endpoint.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0)
    throw ConfigurationError("Benchmarks endpoint \"" + endpoint +
                             "\" is not an absolute URL");

  auto authority_start = scheme_end + 3;
  auto authority_end = endpoint.find_first_of("/?#", authority_start);
  if (authority_end == std::string::npos)
    authority_end = endpoint.size();
  if (authority_end == authority_start)
    throw ConfigurationError("Benchmarks endpoint \"" + endpoint +
                             "\" has no host");

  // An absolute path replaces whatever path the endpoint carried
  return endpoint.substr(0, authority_end) + path;
}

BenchmarksClient::BenchmarksClient(const Config &config, HttpClient &http)
    : config_(config), http_(http) {}

HttpRequest
BenchmarksClient::buildRequest(const std::vector<PriceIdentifier> &price_ids,
                               UnixTimestamp publish_time) const {
  if (!config_.benchmarks_endpoint)
    throw ConfigurationError("Benchmarks endpoint is not set");

  HttpRequest request;
  request.url = joinEndpoint(*config_.benchmarks_endpoint,
                             "/v1/updates/price/" +
                                 std::to_string(publish_time));
  request.timeout = kBenchmarksRequestTimeout;
  request.query.emplace_back("encoding", "hex");
  request.query.emplace_back("parsed", "true");
  for (const auto &id : price_ids)
    request.query.emplace_back("ids", id.toHex());
  return request;
}

PriceFeedsWithUpdateData BenchmarksClient::getVerifiedPriceFeeds(
    const std::vector<PriceIdentifier> &price_ids, UnixTimestamp publish_time) {
  HttpRequest request = buildRequest(price_ids, publish_time);

  spdlog::info("[Benchmarks] Fetching {} feeds at publish_time={}",
               price_ids.size(), publish_time);
  HttpResponse response = http_.get(request);

  if (response.status < 200 || response.status >= 300) {
    throw TransportError("GET " + request.url + " returned HTTP " +
                             std::to_string(response.status) + ": " +
                             response.body.substr(0, 200),
                         response.status);
  }

  auto result = assemble(parseBenchmarkUpdates(response.body),
                         config_.alignment_check);
  spdlog::info("[Benchmarks] Got {} feeds, {} update messages",
               result.price_feeds.size(), result.update_data.size());
  return result;
}

} // namespace benchfeed

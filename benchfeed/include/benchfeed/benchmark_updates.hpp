#pragma once
#include "benchfeed/aggregate.hpp"
#include "benchfeed/binary_blob.hpp"
#include "benchfeed/price_feed.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace benchfeed {

// Body of GET /v1/updates/price/{publish_time}
struct BenchmarkUpdates {
  std::vector<PriceFeed> parsed;
  BinaryBlob binary;
};

void from_json(const nlohmann::json &j, BenchmarkUpdates &u);

// Throws SchemaError when the body is not a BenchmarkUpdates document.
BenchmarkUpdates parseBenchmarkUpdates(const std::string &body);

// Pair every parsed feed with an update record and decode the blob.
// DecodeError from the blob propagates as-is. With
// AlignmentCheck::EQUAL_COUNT a parsed/binary size mismatch throws
// SchemaError; otherwise the two sequences are not cross-checked.
PriceFeedsWithUpdateData
assemble(BenchmarkUpdates updates,
         AlignmentCheck check = AlignmentCheck::NONE);

} // namespace benchfeed

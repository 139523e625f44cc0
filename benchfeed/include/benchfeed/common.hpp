#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace benchfeed {

using UnixTimestamp = int64_t;
using Slot = uint64_t;
using Bytes = std::vector<uint8_t>;

// Whole round trip: connect, send and receive.
constexpr std::chrono::seconds kBenchmarksRequestTimeout{30};

// ── Parsed/binary alignment ──────────────────────────────────────────
enum class AlignmentCheck {
  NONE,       // provider may pack several feeds into one blob item
  EQUAL_COUNT // parsed.size() must equal binary.data.size()
};

// ── Configuration ────────────────────────────────────────────────────
struct Config {
  std::optional<std::string> benchmarks_endpoint; // e.g. https://benchmarks.pyth.network
  AlignmentCheck alignment_check = AlignmentCheck::NONE;
  std::string log_level = "info";
};

} // namespace benchfeed

#pragma once
#include "benchfeed/common.hpp"
#include <array>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace benchfeed {

// ── Price identifier ─────────────────────────────────────────────────
// 32-byte feed key. Canonical text form is 64 lowercase hex digits.
class PriceIdentifier {
public:
  static constexpr size_t kSize = 32;

  PriceIdentifier() { bytes_.fill(0); }
  explicit PriceIdentifier(const std::array<uint8_t, kSize> &bytes)
      : bytes_(bytes) {}

  // Accepts an optional 0x prefix and either case.
  // Throws std::invalid_argument.
  static PriceIdentifier fromHex(const std::string &hex);

  std::string toHex() const;
  const std::array<uint8_t, kSize> &bytes() const { return bytes_; }

  bool operator==(const PriceIdentifier &other) const {
    return bytes_ == other.bytes_;
  }
  bool operator!=(const PriceIdentifier &other) const {
    return !(*this == other);
  }

private:
  std::array<uint8_t, kSize> bytes_;
};

// ── Price ────────────────────────────────────────────────────────────
struct Price {
  int64_t price = 0;
  uint64_t conf = 0;
  int32_t expo = 0;
  UnixTimestamp publish_time = 0;
};

// ── Price feed ───────────────────────────────────────────────────────
struct PriceFeed {
  PriceIdentifier id;
  Price price;
  Price ema_price; // exponentially-weighted moving average
};

// JSON: price/conf as decimal strings, expo/publish_time as integers.
void from_json(const nlohmann::json &j, PriceIdentifier &id);
void to_json(nlohmann::json &j, const PriceIdentifier &id);
void from_json(const nlohmann::json &j, Price &p);
void to_json(nlohmann::json &j, const Price &p);
void from_json(const nlohmann::json &j, PriceFeed &f);
void to_json(nlohmann::json &j, const PriceFeed &f);

} // namespace benchfeed

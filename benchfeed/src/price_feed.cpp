#include "benchfeed/price_feed.hpp"
#include "benchfeed/encoding.hpp"
#include <algorithm>
#include <charconv>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace benchfeed {

PriceIdentifier PriceIdentifier::fromHex(const std::string &hex) {
  std::string digits = hex;
  if (digits.size() >= 2 && digits[0] == '0' &&
      (digits[1] == 'x' || digits[1] == 'X'))
    digits = digits.substr(2);

  if (digits.size() != kSize * 2)
    throw std::invalid_argument("price identifier must be " +
                                std::to_string(kSize * 2) +
                                " hex digits, got " +
                                std::to_string(digits.size()));

  Bytes raw = hexDecode(digits);
  std::array<uint8_t, kSize> bytes;
  std::copy(raw.begin(), raw.end(), bytes.begin());
  return PriceIdentifier(bytes);
}

std::string PriceIdentifier::toHex() const {
  return hexEncode(bytes_.data(), bytes_.size());
}

void from_json(const json &j, PriceIdentifier &id) {
  id = PriceIdentifier::fromHex(j.get<std::string>());
}

void to_json(json &j, const PriceIdentifier &id) { j = id.toHex(); }

// Full-string decimal parse; no sign for unsigned types, no whitespace.
template <typename T> static T parseDecimal(const std::string &s,
                                            const char *field) {
  T value{};
  const char *first = s.data();
  const char *last = s.data() + s.size();
  auto res = std::from_chars(first, last, value);
  if (s.empty() || res.ec != std::errc() || res.ptr != last)
    throw std::invalid_argument(std::string("field '") + field +
                                "' is not a decimal integer: \"" + s + "\"");
  return value;
}

// JSON integer that fits T; rejects booleans, floats and out-of-range values.
template <typename T> static T integerField(const json &j, const char *field) {
  const json &v = j.at(field);
  if (!v.is_number_integer())
    throw std::invalid_argument(std::string("field '") + field +
                                "' is not an integer: " + v.dump());

  bool fits;
  if (v.is_number_unsigned())
    fits = v.get<uint64_t>() <=
           static_cast<uint64_t>(std::numeric_limits<T>::max());
  else
    fits = v.get<int64_t>() >= std::numeric_limits<T>::min() &&
           v.get<int64_t>() <= std::numeric_limits<T>::max();
  if (!fits)
    throw std::invalid_argument(std::string("field '") + field +
                                "' is out of range: " + v.dump());
  return v.get<T>();
}

void from_json(const json &j, Price &p) {
  p.price = parseDecimal<int64_t>(j.at("price").get<std::string>(), "price");
  p.conf = parseDecimal<uint64_t>(j.at("conf").get<std::string>(), "conf");
  p.expo = integerField<int32_t>(j, "expo");
  p.publish_time = integerField<UnixTimestamp>(j, "publish_time");
}

void to_json(json &j, const Price &p) {
  j = json{{"price", std::to_string(p.price)},
           {"conf", std::to_string(p.conf)},
           {"expo", p.expo},
           {"publish_time", p.publish_time}};
}

void from_json(const json &j, PriceFeed &f) {
  f.id = j.at("id").get<PriceIdentifier>();
  f.price = j.at("price").get<Price>();
  f.ema_price = j.at("ema_price").get<Price>();
}

void to_json(json &j, const PriceFeed &f) {
  j = json{{"id", f.id}, {"price", f.price}, {"ema_price", f.ema_price}};
}

} // namespace benchfeed

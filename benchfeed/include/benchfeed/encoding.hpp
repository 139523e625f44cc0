#pragma once
#include "benchfeed/common.hpp"
#include <string>

namespace benchfeed {

// Hex pairs, either case, no "0x" prefix. Throws std::invalid_argument.
Bytes hexDecode(const std::string &hex);

// Lowercase hex.
std::string hexEncode(const uint8_t *data, size_t length);
inline std::string hexEncode(const Bytes &bytes) {
  return hexEncode(bytes.data(), bytes.size());
}

// Standard alphabet, '=' padding required, no line breaks.
// Throws std::invalid_argument.
Bytes base64Decode(const std::string &b64);

std::string base64Encode(const uint8_t *data, size_t length);
inline std::string base64Encode(const Bytes &bytes) {
  return base64Encode(bytes.data(), bytes.size());
}

} // namespace benchfeed

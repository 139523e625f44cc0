#pragma once
#include "benchfeed/common.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace benchfeed {

// Closed set: decodeBlob switches over every value and the build treats
// an unhandled enumerator as an error.
enum class BlobEncoding { BASE64, HEX };

const char *toString(BlobEncoding encoding);

// One encoding for every item; item order is significant.
struct BinaryBlob {
  BlobEncoding encoding = BlobEncoding::HEX;
  std::vector<std::string> data;
};

// Decode every item or none. Throws DecodeError naming the first bad item.
std::vector<Bytes> decodeBlob(const BinaryBlob &blob);

void from_json(const nlohmann::json &j, BlobEncoding &encoding);
void to_json(nlohmann::json &j, BlobEncoding encoding);
void from_json(const nlohmann::json &j, BinaryBlob &blob);

} // namespace benchfeed

#include "benchfeed/binary_blob.hpp"
#include "benchfeed/encoding.hpp"
#include "benchfeed/errors.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace benchfeed {

const char *toString(BlobEncoding encoding) {
  switch (encoding) {
  case BlobEncoding::BASE64:
    return "base64";
  case BlobEncoding::HEX:
    return "hex";
  }
  return "unknown";
}

static Bytes decodeItem(BlobEncoding encoding, const std::string &datum) {
  switch (encoding) {
  case BlobEncoding::BASE64:
    return base64Decode(datum);
  case BlobEncoding::HEX:
    return hexDecode(datum);
  }
  throw std::invalid_argument("unhandled blob encoding");
}

std::vector<Bytes> decodeBlob(const BinaryBlob &blob) {
  std::vector<Bytes> decoded;
  decoded.reserve(blob.data.size());

  for (size_t i = 0; i < blob.data.size(); i++) {
    try {
      decoded.push_back(decodeItem(blob.encoding, blob.data[i]));
    } catch (const std::invalid_argument &e) {
      throw DecodeError(i, blob.encoding, e.what());
    }
  }
  return decoded;
}

void from_json(const json &j, BlobEncoding &encoding) {
  auto name = j.get<std::string>();
  if (name == "base64")
    encoding = BlobEncoding::BASE64;
  else if (name == "hex")
    encoding = BlobEncoding::HEX;
  else
    throw std::invalid_argument("unknown blob encoding \"" + name + "\"");
}

void to_json(json &j, BlobEncoding encoding) { j = toString(encoding); }

void from_json(const json &j, BinaryBlob &blob) {
  blob.encoding = j.at("encoding").get<BlobEncoding>();
  blob.data = j.at("data").get<std::vector<std::string>>();
}

} // namespace benchfeed

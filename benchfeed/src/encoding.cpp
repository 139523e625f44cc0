#include "benchfeed/encoding.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <stdexcept>

namespace benchfeed {

static int hexNibble(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

// ── Hex ──────────────────────────────────────────────────────────────
Bytes hexDecode(const std::string &hex) {
  if (hex.size() % 2 != 0)
    throw std::invalid_argument("odd number of hex digits (" +
                                std::to_string(hex.size()) + ")");

  Bytes out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hexNibble(hex[i]);
    int lo = hexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      size_t bad = hi < 0 ? i : i + 1;
      throw std::invalid_argument("invalid hex character at offset " +
                                  std::to_string(bad));
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string hexEncode(const uint8_t *data, size_t length) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(length * 2);
  for (size_t i = 0; i < length; i++) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0f]);
  }
  return out;
}

// ── Base64 ───────────────────────────────────────────────────────────
static int base64Value(char c) {
  if (c >= 'A' && c <= 'Z')
    return c - 'A';
  if (c >= 'a' && c <= 'z')
    return c - 'a' + 26;
  if (c >= '0' && c <= '9')
    return c - '0' + 52;
  if (c == '+')
    return 62;
  if (c == '/')
    return 63;
  return -1;
}

Bytes base64Decode(const std::string &b64) {
  if (b64.empty())
    return {};
  if (b64.size() % 4 != 0)
    throw std::invalid_argument("base64 length " + std::to_string(b64.size()) +
                                " is not a multiple of 4");

  // EVP_DecodeBlock tolerates surrounding whitespace and stray padding, so
  // the alphabet and padding position are checked here first.
  size_t padding = 0;
  for (size_t i = 0; i < b64.size(); i++) {
    char c = b64[i];
    if (c == '=') {
      if (i < b64.size() - 2)
        throw std::invalid_argument("base64 padding at offset " +
                                    std::to_string(i));
      padding++;
    } else if (padding > 0 || base64Value(c) < 0) {
      throw std::invalid_argument("invalid base64 character at offset " +
                                  std::to_string(i));
    }
  }

  // Bits below the last full byte must be zero
  if (padding > 0) {
    int last = base64Value(b64[b64.size() - padding - 1]);
    int unused_mask = padding == 2 ? 0x0f : 0x03;
    if ((last & unused_mask) != 0)
      throw std::invalid_argument("non-canonical base64 trailing bits");
  }

  Bytes out(b64.size() / 4 * 3);
  int len = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char *>(b64.data()),
                            static_cast<int>(b64.size()));
  if (len < 0)
    throw std::invalid_argument("malformed base64");

  // EVP_DecodeBlock counts the zero bytes produced by padding
  out.resize(static_cast<size_t>(len) - padding);
  return out;
}

std::string base64Encode(const uint8_t *data, size_t length) {
  if (length == 0)
    return "";

  BIO *bmem, *b64;
  BUF_MEM *bptr;

  b64 = BIO_new(BIO_f_base64());
  BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL); // No newlines
  bmem = BIO_new(BIO_s_mem());
  b64 = BIO_push(b64, bmem);
  BIO_write(b64, data, static_cast<int>(length));
  BIO_flush(b64);
  BIO_get_mem_ptr(b64, &bptr);

  std::string result(bptr->data, bptr->length);
  BIO_free_all(b64);
  return result;
}

} // namespace benchfeed

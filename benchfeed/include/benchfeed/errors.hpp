#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace benchfeed {

enum class BlobEncoding;

// Base for every failure a Benchmarks fetch can report.
class BenchmarksError : public std::runtime_error {
public:
  explicit BenchmarksError(const std::string &what)
      : std::runtime_error(what) {}
};

// Endpoint missing or unusable. Raised before any network activity.
class ConfigurationError : public BenchmarksError {
public:
  explicit ConfigurationError(const std::string &what)
      : BenchmarksError("configuration error: " + what) {}
};

// Connection failure, timeout or non-2xx reply.
class TransportError : public BenchmarksError {
public:
  explicit TransportError(const std::string &what, long http_status = 0)
      : BenchmarksError("transport error: " + what), http_status_(http_status) {}

  // 0 when no response was received
  long httpStatus() const { return http_status_; }

private:
  long http_status_;
};

// Response body does not match the expected provider shape.
class SchemaError : public BenchmarksError {
public:
  explicit SchemaError(const std::string &what)
      : BenchmarksError("schema error: " + what) {}
};

// A binary blob item is not valid under the blob's declared encoding.
class DecodeError : public BenchmarksError {
public:
  DecodeError(std::size_t index, BlobEncoding encoding,
              const std::string &reason);

  std::size_t index() const { return index_; }
  BlobEncoding encoding() const { return encoding_; }

private:
  std::size_t index_;
  BlobEncoding encoding_;
};

} // namespace benchfeed

#include "benchfeed/errors.hpp"
#include "benchfeed/binary_blob.hpp"

namespace benchfeed {

DecodeError::DecodeError(std::size_t index, BlobEncoding encoding,
                         const std::string &reason)
    : BenchmarksError("decode error: item " + std::to_string(index) +
                      " is not valid " + toString(encoding) + ": " + reason),
      index_(index), encoding_(encoding) {}

} // namespace benchfeed

// SPDX-License-Identifier: MIT
#ifndef VUP_RESPONSE_HH_
#define VUP_RESPONSE_HH_

#include <string>

#include "absl/status/statusor.h"
#include "vup/index.hh"

namespace vup {

struct IndexResponse {
  // Decodes a freshly downloaded index. The raw bytes are kept alongside the
  // decoded form so that they can be written to the cache verbatim.
  static absl::StatusOr<IndexResponse> Parse(std::string bytes);

  // The server answered our conditional request with "304 Not Modified".
  static IndexResponse NotModified() {
    IndexResponse response;
    response.not_modified = true;
    return response;
  }

  IndexResponse() = default;

  IndexResponse(const IndexResponse&) = default;
  IndexResponse& operator=(const IndexResponse&) = default;

  IndexResponse(IndexResponse&&) = default;
  IndexResponse& operator=(IndexResponse&&) = default;

  bool not_modified = false;

  // The ETag header of the response, if the server sent one.
  std::string etag;

  std::string bytes;
  Index index;
};

struct RawResponse {
  static absl::StatusOr<RawResponse> Parse(std::string bytes) {
    return RawResponse(std::move(bytes));
  }

  RawResponse(std::string bytes) : bytes(std::move(bytes)) {}

  RawResponse(const RawResponse&) = default;
  RawResponse& operator=(const RawResponse&) = default;

  RawResponse(RawResponse&&) = default;
  RawResponse& operator=(RawResponse&&) = default;

  std::string bytes;
};

}  // namespace vup

#endif  // VUP_RESPONSE_HH_

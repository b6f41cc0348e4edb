// SPDX-License-Identifier: MIT
#include "vup/response.hh"

namespace vup {

// static
absl::StatusOr<IndexResponse> IndexResponse::Parse(std::string bytes) {
  auto index = Index::Parse(bytes);
  if (!index.ok()) {
    return index.status();
  }

  IndexResponse response;
  response.bytes = std::move(bytes);
  response.index = *std::move(index);
  return response;
}

}  // namespace vup

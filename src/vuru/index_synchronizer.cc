// SPDX-License-Identifier: MIT
#include "vuru/index_synchronizer.hh"

#include <cstring>
#include <iostream>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace vuru {

namespace {

void SetSource(SyncSource* source, SyncSource value) {
  if (source != nullptr) {
    *source = value;
  }
}

}  // namespace

absl::StatusOr<vup::Index> IndexSynchronizer::LoadCached() const {
  auto bytes = store_->ReadIndex();
  if (!bytes.ok()) {
    return bytes.status();
  }

  auto index = vup::Index::Parse(*bytes);
  if (!index.ok()) {
    return absl::DataLossError(
        absl::StrCat("cached index is corrupt: ", index.status().message()));
  }

  return index;
}

absl::StatusOr<vup::IndexResponse> IndexSynchronizer::Fetch(
    std::optional<std::string> if_none_match) {
  absl::StatusOr<vup::IndexResponse> result =
      absl::UnknownError("index request did not complete");

  client_->QueueIndexRequest(
      vup::IndexRequest(std::move(if_none_match)),
      [&result](absl::StatusOr<vup::IndexResponse> response) {
        result = std::move(response);
        return 0;
      });

  if (int r = client_->Wait(); r < 0) {
    return absl::UnavailableError(
        absl::StrCat("index request failed: ", strerror(-r)));
  }

  return result;
}

absl::StatusOr<PackageDirectory> IndexSynchronizer::Sync(bool force_refresh,
                                                         SyncSource* source) {
  auto cached = LoadCached();
  if (cached.ok() && !force_refresh) {
    SetSource(source, SyncSource::CACHE);
    return PackageDirectory(*std::move(cached));
  }

  if (absl::IsDataLoss(cached.status())) {
    std::cerr << "warning: " << cached.status().message() << "\n";
  }

  // The token only vouches for the bytes it was stored with. If those bytes
  // are unusable, a "not modified" answer would leave us with nothing.
  std::optional<std::string> if_none_match;
  if (cached.ok()) {
    if_none_match = store_->ReadFreshnessToken();
  }

  auto response = Fetch(std::move(if_none_match));
  if (response.ok() && response->not_modified) {
    if (!cached.ok()) {
      return absl::UnavailableError(
          "server reported the package index as unchanged, but no usable "
          "cached copy exists");
    }

    SetSource(source, SyncSource::NOT_MODIFIED);
    return PackageDirectory(*std::move(cached));
  }

  if (response.ok()) {
    std::optional<std::string_view> token;
    if (!response->etag.empty()) {
      token = response->etag;
    }

    if (auto status = store_->WriteIndex(response->bytes, token);
        !status.ok()) {
      return status;
    }

    SetSource(source, SyncSource::FETCHED);
    return PackageDirectory(std::move(response->index));
  }

  if (cached.ok()) {
    std::cerr << "warning: failed to refresh package index ("
              << response.status().message() << "), using cached copy\n";
    SetSource(source, SyncSource::STALE_CACHE);
    return PackageDirectory(*std::move(cached));
  }

  return absl::UnavailableError(
      absl::StrCat("failed to fetch package index and no cache is available: ",
                   response.status().message()));
}

}  // namespace vuru

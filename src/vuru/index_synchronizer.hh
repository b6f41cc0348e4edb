// SPDX-License-Identifier: MIT
#ifndef VURU_INDEX_SYNCHRONIZER_HH_
#define VURU_INDEX_SYNCHRONIZER_HH_

#include <optional>
#include <string>

#include "absl/status/statusor.h"
#include "vup/client.hh"
#include "vup/index.hh"
#include "vuru/local_store.hh"
#include "vuru/package_directory.hh"

namespace vuru {

// Where the index returned by a synchronization came from.
enum class SyncSource : short {
  // The cached copy, no network traffic.
  CACHE,

  // The cached copy, after the server confirmed it is current.
  NOT_MODIFIED,

  // A freshly downloaded copy, now also in the cache.
  FETCHED,

  // The cached copy, because the server could not provide a usable one.
  STALE_CACHE,
};

class IndexSynchronizer {
 public:
  struct Options {
    Options& set_client(vup::Client* client) {
      this->client = client;
      return *this;
    }

    Options& set_store(LocalStore* store) {
      this->store = store;
      return *this;
    }

    vup::Client* client = nullptr;
    LocalStore* store = nullptr;
  };

  explicit IndexSynchronizer(Options options)
      : client_(options.client), store_(options.store) {}

  IndexSynchronizer(const IndexSynchronizer&) = delete;
  IndexSynchronizer& operator=(const IndexSynchronizer&) = delete;

  IndexSynchronizer(IndexSynchronizer&&) = default;
  IndexSynchronizer& operator=(IndexSynchronizer&&) = default;

  // Produces the package directory, going to the network only when
  // |force_refresh| is set or the cache is unusable. A decodable cache is
  // preferred over any failed network attempt. Fails with an Unavailable
  // error if neither the network nor the cache yields an index.
  absl::StatusOr<PackageDirectory> Sync(bool force_refresh,
                                        SyncSource* source = nullptr);

  // Decodes the cached index without touching the network. Returns NotFound
  // if nothing is cached and DataLoss if the cached bytes don't decode.
  absl::StatusOr<vup::Index> LoadCached() const;

 private:
  absl::StatusOr<vup::IndexResponse> Fetch(
      std::optional<std::string> if_none_match);

  vup::Client* client_;
  LocalStore* store_;
};

}  // namespace vuru

#endif  // VURU_INDEX_SYNCHRONIZER_HH_

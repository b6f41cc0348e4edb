// SPDX-License-Identifier: MIT
#ifndef VUP_INDEX_HH_
#define VUP_INDEX_HH_

#include <string>
#include <string_view>

#include "absl/container/btree_map.h"
#include "absl/status/statusor.h"
#include "vup/package.hh"

namespace vup {

// A decoded snapshot of the package index, keyed by package name. An Index is
// only ever built whole by Parse; there is no way to patch one in place.
class Index {
 public:
  using PackageMap = absl::btree_map<std::string, Package>;

  // Decodes an index payload: a JSON object mapping package names to objects
  // with string fields "category", "version" and "repo_url". Any malformed
  // entry fails the whole decode.
  static absl::StatusOr<Index> Parse(std::string_view bytes);

  Index() = default;
  explicit Index(PackageMap packages) : packages_(std::move(packages)) {}

  Index(const Index&) = default;
  Index& operator=(const Index&) = default;

  Index(Index&&) = default;
  Index& operator=(Index&&) = default;

  const PackageMap& packages() const { return packages_; }

  int size() const { return packages_.size(); }

  bool empty() const { return packages_.empty(); }

 private:
  PackageMap packages_;
};

inline bool operator==(const Index& a, const Index& b) {
  return a.packages() == b.packages();
}

}  // namespace vup

#endif  // VUP_INDEX_HH_

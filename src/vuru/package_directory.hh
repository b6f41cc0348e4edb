// SPDX-License-Identifier: MIT
#ifndef VURU_PACKAGE_DIRECTORY_HH_
#define VURU_PACKAGE_DIRECTORY_HH_

#include <string>
#include <string_view>
#include <vector>

#include "vup/index.hh"
#include "vup/package.hh"

namespace vuru {

// Read-only view over one decoded index snapshot. A directory is never edited;
// a new synchronization produces a new directory.
class PackageDirectory {
 public:
  PackageDirectory() = default;
  explicit PackageDirectory(vup::Index index) : index_(std::move(index)) {}
  ~PackageDirectory() = default;

  PackageDirectory(const PackageDirectory&) = delete;
  PackageDirectory& operator=(const PackageDirectory&) = delete;

  PackageDirectory(PackageDirectory&&) = default;
  PackageDirectory& operator=(PackageDirectory&&) = default;

  // Returns every package whose name contains |query|, ordered by name. An
  // empty query matches everything.
  std::vector<const vup::Package*> Search(std::string_view query) const;

  const vup::Package* Lookup(const std::string& pkgname) const;

  std::vector<std::string> Names() const;

  const vup::Index& index() const { return index_; }

  int size() const { return index_.size(); }

  bool empty() const { return size() == 0; }

 private:
  vup::Index index_;
};

}  // namespace vuru

#endif  // VURU_PACKAGE_DIRECTORY_HH_

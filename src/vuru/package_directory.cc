// SPDX-License-Identifier: MIT
#include "vuru/package_directory.hh"

#include "absl/strings/match.h"

namespace vuru {

std::vector<const vup::Package*> PackageDirectory::Search(
    std::string_view query) const {
  std::vector<const vup::Package*> results;

  // The index is keyed by name in a sorted map, so results come out in
  // lexicographic order without a separate sort.
  for (const auto& [name, package] : index_.packages()) {
    if (absl::StrContains(name, query)) {
      results.push_back(&package);
    }
  }

  return results;
}

const vup::Package* PackageDirectory::Lookup(
    const std::string& pkgname) const {
  const auto iter = index_.packages().find(pkgname);
  return iter == index_.packages().end() ? nullptr : &iter->second;
}

std::vector<std::string> PackageDirectory::Names() const {
  std::vector<std::string> names;
  names.reserve(index_.size());

  for (const auto& [name, _] : index_.packages()) {
    names.push_back(name);
  }

  return names;
}

}  // namespace vuru

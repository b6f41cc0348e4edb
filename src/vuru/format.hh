// SPDX-License-Identifier: MIT
#ifndef VURU_FORMAT_HH_
#define VURU_FORMAT_HH_

#include <vector>

#include "vup/package.hh"
#include "vuru/package_manager.hh"

namespace format {

void NameOnly(const vup::Package& package);
void Update(const vuru::PackageManager::Package& from, const vup::Package& to);

// Prints a table of name, version and category, one row per package.
void SearchTable(const std::vector<const vup::Package*>& packages);

}  // namespace format

#endif  // VURU_FORMAT_HH_

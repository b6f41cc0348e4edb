// SPDX-License-Identifier: MIT
#ifndef VURU_PACKAGE_MANAGER_HH_
#define VURU_PACKAGE_MANAGER_HH_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace vuru {

// The system package manager which performs the actual installation.
class PackageManager {
 public:
  struct Package {
    Package(std::string pkgname, std::string pkgver)
        : pkgname(std::move(pkgname)), pkgver(std::move(pkgver)) {}

    bool operator==(const Package&) const = default;

    std::string pkgname;
    std::string pkgver;
  };

  PackageManager() = default;
  virtual ~PackageManager() = default;

  PackageManager(const PackageManager&) = delete;
  PackageManager& operator=(const PackageManager&) = delete;

  // Installs |pkgname| from the repository at |repo_url|. Unless |assume_yes|
  // is set, the package manager asks for its own confirmation.
  virtual absl::Status Install(const std::string& pkgname,
                               const std::string& repo_url,
                               bool assume_yes) = 0;

  virtual absl::Status Upgrade(const std::string& pkgname,
                               const std::string& repo_url,
                               bool assume_yes) = 0;

  virtual absl::Status Remove(const std::string& pkgname, bool assume_yes) = 0;

  // Every package installed on the system, from any source.
  virtual absl::StatusOr<std::vector<Package>> ListInstalled() const = 0;

  // Returns <0, 0 or >0 as version |a| is older than, equal to, or newer than
  // version |b|.
  virtual absl::StatusOr<int> CompareVersions(const std::string& a,
                                              const std::string& b) const = 0;
};

}  // namespace vuru

#endif  // VURU_PACKAGE_MANAGER_HH_

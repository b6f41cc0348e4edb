// SPDX-License-Identifier: MIT
#ifndef VURU_XBPS_HH_
#define VURU_XBPS_HH_

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "vuru/package_manager.hh"

namespace vuru {

// PackageManager backed by the xbps command line tools. Changes to the system
// go through sudo.
class Xbps : public PackageManager {
 public:
  // Runs a command line and returns its exit status. The child's stdout goes
  // to |output| when it is non-null.
  using Runner = std::function<absl::StatusOr<int>(
      const std::vector<std::string>& argv, std::string* output)>;

  Xbps();
  explicit Xbps(Runner runner) : runner_(std::move(runner)) {}

  // Parses the output of `xbps-query -l`. Each line carries a state column
  // followed by "<pkgname>-<version>"; the version is everything after the
  // last dash.
  static std::vector<Package> ParseInstalled(std::string_view listing);

  absl::Status Install(const std::string& pkgname, const std::string& repo_url,
                       bool assume_yes) override;
  absl::Status Upgrade(const std::string& pkgname, const std::string& repo_url,
                       bool assume_yes) override;
  absl::Status Remove(const std::string& pkgname, bool assume_yes) override;

  absl::StatusOr<std::vector<Package>> ListInstalled() const override;
  absl::StatusOr<int> CompareVersions(const std::string& a,
                                      const std::string& b) const override;

 private:
  absl::Status RunChecked(std::vector<std::string> argv) const;

  Runner runner_;
};

}  // namespace vuru

#endif  // VURU_XBPS_HH_

// SPDX-License-Identifier: MIT
#ifndef VUP_PACKAGE_HH_
#define VUP_PACKAGE_HH_

#include <string>

namespace vup {

struct Package {
  Package() = default;

  std::string name;
  std::string category;
  std::string version;
  std::string repo_url;
};

inline bool operator==(const Package& a, const Package& b) {
  return a.name == b.name && a.category == b.category &&
         a.version == b.version && a.repo_url == b.repo_url;
}

}  // namespace vup

#endif  // VUP_PACKAGE_HH_

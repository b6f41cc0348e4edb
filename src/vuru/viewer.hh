// SPDX-License-Identifier: MIT
#ifndef VURU_VIEWER_HH_
#define VURU_VIEWER_HH_

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"

namespace vuru {

// Shows build templates to the user during review.
class Viewer {
 public:
  // Returns a viewer which pages through $PAGER (default "less") and renders
  // differences with diff(1).
  static std::unique_ptr<Viewer> NewExternal();

  Viewer() = default;
  virtual ~Viewer() = default;

  Viewer(const Viewer&) = delete;
  Viewer& operator=(const Viewer&) = delete;

  // Shows the full text of a template.
  virtual absl::Status Page(const std::string& pkgname,
                            std::string_view content) = 0;

  // Shows a unified diff from |previous| to |current|.
  virtual absl::Status Diff(const std::string& pkgname,
                            std::string_view previous,
                            std::string_view current) = 0;
};

// Exposed for testing.
std::vector<std::string> PagerCommand(const char* pager_env,
                                      const std::string& path);
std::vector<std::string> DiffCommand(const std::string& pkgname,
                                     const std::string& previous_path,
                                     const std::string& current_path,
                                     bool color);

}  // namespace vuru

#endif  // VURU_VIEWER_HH_

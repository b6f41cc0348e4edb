// SPDX-License-Identifier: MIT
#ifndef VURU_LOCAL_STORE_HH_
#define VURU_LOCAL_STORE_HH_

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace vuru {

// The on-disk cache: the package index together with its freshness token, and
// the last reviewed build template of every installed package.
//
//   <root>/index.json
//   <root>/index.json.etag
//   <root>/templates/<pkgname>
//
// There is no locking. Concurrent invocations may interleave writes.
class LocalStore {
 public:
  // Returns $XDG_CACHE_HOME/vup, falling back to $HOME/.cache/vup. Fails with
  // a FailedPrecondition error if neither variable holds an absolute path.
  static absl::StatusOr<std::filesystem::path> DefaultRoot();

  // Opens the store rooted at |root|, creating the directory if needed. Fails
  // with a FailedPrecondition error if the directory cannot be created.
  static absl::StatusOr<std::unique_ptr<LocalStore>> Open(
      std::filesystem::path root);

  // Package names become file names, so only a conservative character set is
  // accepted.
  static bool IsValidKey(std::string_view name);

  ~LocalStore() = default;

  LocalStore(const LocalStore&) = delete;
  LocalStore& operator=(const LocalStore&) = delete;

  LocalStore(LocalStore&&) = default;
  LocalStore& operator=(LocalStore&&) = default;

  // Returns the cached index bytes, or a NotFound error if nothing is cached.
  absl::StatusOr<std::string> ReadIndex() const;

  // Replaces the cached index and its token. The token write is best-effort:
  // its failure is logged and does not fail the call. Without a token, any
  // previously stored one is removed.
  absl::Status WriteIndex(std::string_view bytes,
                          std::optional<std::string_view> token);

  // Returns the stored token, but only while the index it belongs to exists.
  std::optional<std::string> ReadFreshnessToken() const;

  absl::StatusOr<std::string> ReadTemplate(const std::string& pkgname) const;
  absl::Status WriteTemplate(const std::string& pkgname,
                             std::string_view content);

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path index_path() const { return root_ / "index.json"; }
  std::filesystem::path token_path() const {
    return root_ / "index.json.etag";
  }
  std::filesystem::path template_path(const std::string& pkgname) const {
    return root_ / "templates" / pkgname;
  }

 private:
  explicit LocalStore(std::filesystem::path root) : root_(std::move(root)) {}

  std::filesystem::path root_;
};

}  // namespace vuru

#endif  // VURU_LOCAL_STORE_HH_

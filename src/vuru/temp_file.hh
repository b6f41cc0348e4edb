// SPDX-License-Identifier: MIT
#ifndef VURU_TEMP_FILE_HH_
#define VURU_TEMP_FILE_HH_

#include <filesystem>
#include <memory>
#include <string_view>

#include "absl/status/statusor.h"

namespace vuru {

// A uniquely named file in $TMPDIR (or /tmp), removed when the object is
// destroyed.
class TempFile {
 public:
  // Creates the file and fills it with |content|. The file name starts with
  // |prefix|.
  static absl::StatusOr<std::unique_ptr<TempFile>> Create(
      std::string_view prefix, std::string_view content);

  ~TempFile();

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  TempFile(TempFile&&) = delete;
  TempFile& operator=(TempFile&&) = delete;

  const std::filesystem::path& path() const { return path_; }

 private:
  explicit TempFile(std::filesystem::path path) : path_(std::move(path)) {}

  std::filesystem::path path_;
};

}  // namespace vuru

#endif  // VURU_TEMP_FILE_HH_

// SPDX-License-Identifier: MIT
#include "vuru/temp_file.hh"

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <system_error>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace fs = std::filesystem;

namespace vuru {

namespace {

fs::path TempDir() {
  const char* tmpdir = getenv("TMPDIR");
  if (tmpdir != nullptr && tmpdir[0] == '/') {
    return tmpdir;
  }

  return "/tmp";
}

}  // namespace

// static
absl::StatusOr<std::unique_ptr<TempFile>> TempFile::Create(
    std::string_view prefix, std::string_view content) {
  std::string path =
      (TempDir() / absl::StrCat("vuru-", prefix, ".XXXXXX")).string();

  int fd = mkstemp(path.data());
  if (fd < 0) {
    return absl::InternalError(absl::StrCat(
        "failed to create temporary file ", path, ": ", strerror(errno)));
  }

  // From here on the destructor takes care of the file.
  std::unique_ptr<TempFile> file(new TempFile(path));

  while (!content.empty()) {
    ssize_t n = write(fd, content.data(), content.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      int saved_errno = errno;
      close(fd);
      return absl::InternalError(absl::StrCat(
          "failed to write temporary file ", path, ": ", strerror(saved_errno)));
    }
    content.remove_prefix(n);
  }

  if (close(fd) < 0) {
    return absl::InternalError(absl::StrCat(
        "failed to write temporary file ", path, ": ", strerror(errno)));
  }

  return file;
}

TempFile::~TempFile() {
  std::error_code ec;
  fs::remove(path_, ec);
}

}  // namespace vuru

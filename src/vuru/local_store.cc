// SPDX-License-Identifier: MIT
#include "vuru/local_store.hh"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

namespace fs = std::filesystem;

namespace vuru {

namespace {

std::string_view GetEnv(const char* name) {
  const auto* value = getenv(name);
  return value ? std::string_view(value) : std::string_view();
}

absl::StatusOr<std::string> ReadFile(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return absl::NotFoundError(
        absl::StrCat(path.string(), ": no such file"));
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return absl::DataLossError(
        absl::StrCat("failed to open ", path.string()));
  }

  std::string contents((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
  if (file.bad()) {
    return absl::DataLossError(
        absl::StrCat("failed to read ", path.string()));
  }

  return contents;
}

// Writes to a sibling temporary file and renames it over |path| so readers
// never observe a partially written file.
absl::Status WriteFileAtomically(const fs::path& path,
                                 std::string_view contents) {
  fs::path tmp = path;
  tmp += ".tmp";

  {
    std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return absl::FailedPreconditionError(
          absl::StrCat("failed to open ", tmp.string(), " for writing"));
    }

    file.write(contents.data(), contents.size());
    file.close();
    if (file.fail()) {
      std::error_code ignored;
      fs::remove(tmp, ignored);
      return absl::FailedPreconditionError(
          absl::StrCat("failed to write ", tmp.string()));
    }
  }

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return absl::FailedPreconditionError(absl::StrCat(
        "failed to rename ", tmp.string(), ": ", ec.message()));
  }

  return absl::OkStatus();
}

}  // namespace

// static
absl::StatusOr<fs::path> LocalStore::DefaultRoot() {
  if (const auto xdg = GetEnv("XDG_CACHE_HOME"); absl::StartsWith(xdg, "/")) {
    return fs::path(xdg) / "vup";
  }

  if (const auto home = GetEnv("HOME"); absl::StartsWith(home, "/")) {
    return fs::path(home) / ".cache" / "vup";
  }

  return absl::FailedPreconditionError(
      "unable to determine cache directory: neither XDG_CACHE_HOME nor HOME "
      "is set to an absolute path");
}

// static
absl::StatusOr<std::unique_ptr<LocalStore>> LocalStore::Open(fs::path root) {
  std::error_code ec;
  fs::create_directories(root, ec);
  if (ec || !fs::is_directory(root, ec)) {
    return absl::FailedPreconditionError(
        absl::StrCat("failed to create cache directory ", root.string(), ": ",
                     ec ? ec.message() : "not a directory"));
  }

  return std::unique_ptr<LocalStore>(new LocalStore(std::move(root)));
}

// static
bool LocalStore::IsValidKey(std::string_view name) {
  if (name.empty() || name.front() == '.') {
    return false;
  }

  for (const char c : name) {
    if (!absl::ascii_isalnum(c) && c != '-' && c != '_' && c != '.' &&
        c != '+') {
      return false;
    }
  }

  return !absl::StrContains(name, "..");
}

absl::StatusOr<std::string> LocalStore::ReadIndex() const {
  return ReadFile(index_path());
}

absl::Status LocalStore::WriteIndex(std::string_view bytes,
                                    std::optional<std::string_view> token) {
  // The old token describes the old bytes only. Drop it first so that no
  // failure below can pair it with the new index.
  std::error_code ec;
  fs::remove(token_path(), ec);
  if (ec) {
    return absl::FailedPreconditionError(absl::StrCat(
        "failed to remove stale ", token_path().string(), ": ", ec.message()));
  }

  if (auto status = WriteFileAtomically(index_path(), bytes); !status.ok()) {
    return status;
  }

  if (!token.has_value()) {
    return absl::OkStatus();
  }

  if (auto status = WriteFileAtomically(token_path(), *token); !status.ok()) {
    // The index itself is in place. Without a token the next sync simply
    // won't be conditional.
    std::cerr << "warning: failed to save index freshness token: "
              << status.message() << "\n";
  }

  return absl::OkStatus();
}

std::optional<std::string> LocalStore::ReadFreshnessToken() const {
  std::error_code ec;
  if (!fs::is_regular_file(index_path(), ec)) {
    return std::nullopt;
  }

  auto token = ReadFile(token_path());
  if (!token.ok()) {
    return std::nullopt;
  }

  auto stripped = absl::StripAsciiWhitespace(*token);
  if (stripped.empty()) {
    return std::nullopt;
  }

  return std::string(stripped);
}

absl::StatusOr<std::string> LocalStore::ReadTemplate(
    const std::string& pkgname) const {
  if (!IsValidKey(pkgname)) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid package name: ", pkgname));
  }

  return ReadFile(template_path(pkgname));
}

absl::Status LocalStore::WriteTemplate(const std::string& pkgname,
                                       std::string_view content) {
  if (!IsValidKey(pkgname)) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid package name: ", pkgname));
  }

  const auto path = template_path(pkgname);

  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    return absl::FailedPreconditionError(
        absl::StrCat("failed to create ", path.parent_path().string(), ": ",
                     ec.message()));
  }

  return WriteFileAtomically(path, content);
}

}  // namespace vuru

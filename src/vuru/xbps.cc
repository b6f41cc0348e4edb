// SPDX-License-Identifier: MIT
#include "vuru/xbps.hh"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "vuru/process.hh"

namespace vuru {

Xbps::Xbps()
    : runner_([](const std::vector<std::string>& argv, std::string* output) {
        return RunProcess(argv, output);
      }) {}

// static
std::vector<PackageManager::Package> Xbps::ParseInstalled(
    std::string_view listing) {
  std::vector<Package> packages;

  for (std::string_view line :
       absl::StrSplit(listing, '\n', absl::SkipWhitespace())) {
    std::vector<std::string_view> columns =
        absl::StrSplit(line, absl::ByAnyChar(" \t"), absl::SkipEmpty());
    if (columns.size() < 2) {
      continue;
    }

    std::string_view pkgver = columns[1];
    auto dash = pkgver.rfind('-');
    if (dash == pkgver.npos || dash == 0 || dash + 1 == pkgver.size()) {
      continue;
    }

    packages.emplace_back(std::string(pkgver.substr(0, dash)),
                          std::string(pkgver.substr(dash + 1)));
  }

  return packages;
}

absl::Status Xbps::RunChecked(std::vector<std::string> argv) const {
  auto exit_status = runner_(argv, nullptr);
  if (!exit_status.ok()) {
    return exit_status.status();
  }

  if (*exit_status != 0) {
    return absl::InternalError(absl::StrCat("command failed with exit status ",
                                            *exit_status, ": ",
                                            absl::StrJoin(argv, " ")));
  }

  return absl::OkStatus();
}

absl::Status Xbps::Install(const std::string& pkgname,
                           const std::string& repo_url, bool assume_yes) {
  std::vector<std::string> argv = {"sudo", "xbps-install", "-R", repo_url,
                                   "-S"};
  if (assume_yes) {
    argv.push_back("-y");
  }
  argv.push_back(pkgname);

  return RunChecked(std::move(argv));
}

absl::Status Xbps::Upgrade(const std::string& pkgname,
                           const std::string& repo_url, bool assume_yes) {
  std::vector<std::string> argv = {"sudo", "xbps-install", "-R", repo_url,
                                   "-Su"};
  if (assume_yes) {
    argv.push_back("-y");
  }
  argv.push_back(pkgname);

  return RunChecked(std::move(argv));
}

absl::Status Xbps::Remove(const std::string& pkgname, bool assume_yes) {
  std::vector<std::string> argv = {"sudo", "xbps-remove", "-R"};
  if (assume_yes) {
    argv.push_back("-y");
  }
  argv.push_back(pkgname);

  return RunChecked(std::move(argv));
}

absl::StatusOr<std::vector<PackageManager::Package>> Xbps::ListInstalled()
    const {
  std::string output;
  auto exit_status = runner_({"xbps-query", "-l"}, &output);
  if (!exit_status.ok()) {
    return exit_status.status();
  }

  if (*exit_status != 0) {
    return absl::InternalError(absl::StrCat(
        "xbps-query exited with unexpected exit status ", *exit_status));
  }

  return ParseInstalled(output);
}

absl::StatusOr<int> Xbps::CompareVersions(const std::string& a,
                                          const std::string& b) const {
  auto exit_status = runner_({"xbps-uhelper", "cmpver", a, b}, nullptr);
  if (!exit_status.ok()) {
    return exit_status.status();
  }

  switch (*exit_status) {
    case 0:
      return 0;
    case 1:
      return 1;
    case 255:
      return -1;
  }

  return absl::InternalError(absl::StrCat(
      "xbps-uhelper cmpver ", a, " ", b, " exited with unexpected exit status ",
      *exit_status));
}

}  // namespace vuru

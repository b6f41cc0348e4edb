// SPDX-License-Identifier: MIT
#include "vuru/viewer.hh"

#include <cstdlib>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "vuru/process.hh"
#include "vuru/temp_file.hh"
#include "vuru/terminal.hh"

namespace vuru {

std::vector<std::string> PagerCommand(const char* pager_env,
                                      const std::string& path) {
  std::vector<std::string> cmd;
  if (pager_env != nullptr) {
    std::vector<std::string> words = absl::StrSplit(
        pager_env, absl::ByAnyChar(" \t"), absl::SkipWhitespace());
    cmd = std::move(words);
  }
  if (cmd.empty()) {
    cmd.push_back("less");
  }

  cmd.push_back(path);
  return cmd;
}

std::vector<std::string> DiffCommand(const std::string& pkgname,
                                     const std::string& previous_path,
                                     const std::string& current_path,
                                     bool color) {
  // clang-format off
  return {
    "diff",
    "-u",
    color ? "--color=always" : "--color=never",
    "--label", absl::StrCat("a/", pkgname, "/template"),
    "--label", absl::StrCat("b/", pkgname, "/template"),
    previous_path,
    current_path,
  };
  // clang-format on
}

namespace {

class ExternalViewer : public Viewer {
 public:
  absl::Status Page(const std::string& pkgname,
                    std::string_view content) override {
    auto file = TempFile::Create(absl::StrCat(pkgname, ".template"), content);
    if (!file.ok()) {
      return file.status();
    }

    auto cmd = PagerCommand(getenv("PAGER"), (*file)->path().string());
    auto exit_status = RunProcess(cmd);
    if (!exit_status.ok()) {
      return exit_status.status();
    }

    if (*exit_status != 0) {
      return absl::InternalError(absl::StrCat(
          cmd[0], " exited with unexpected exit status ", *exit_status));
    }

    return absl::OkStatus();
  }

  absl::Status Diff(const std::string& pkgname, std::string_view previous,
                    std::string_view current) override {
    auto previous_file =
        TempFile::Create(absl::StrCat(pkgname, ".old"), previous);
    if (!previous_file.ok()) {
      return previous_file.status();
    }

    auto current_file = TempFile::Create(absl::StrCat(pkgname, ".new"), current);
    if (!current_file.ok()) {
      return current_file.status();
    }

    auto exit_status = RunProcess(DiffCommand(
        pkgname, (*previous_file)->path().string(),
        (*current_file)->path().string(), terminal::WantsColor()));
    if (!exit_status.ok()) {
      return exit_status.status();
    }

    // 0 and 1 mean "same" and "different". Anything else is trouble.
    if (*exit_status > 1) {
      return absl::InternalError(absl::StrCat(
          "diff exited with unexpected exit status ", *exit_status));
    }

    return absl::OkStatus();
  }
};

}  // namespace

std::unique_ptr<Viewer> Viewer::NewExternal() {
  return std::make_unique<ExternalViewer>();
}

}  // namespace vuru

// SPDX-License-Identifier: MIT
#include "vuru/completion.hh"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using testing::AllOf;
using testing::HasSubstr;
using testing::StartsWith;

namespace {

TEST(CompletionTest, BashCompletesCommandsAndPackages) {
  auto script = completion::Script("bash");
  ASSERT_TRUE(script.ok()) << script.status();

  EXPECT_THAT(*script,
              AllOf(HasSubstr("complete -F _vuru vuru"),
                    HasSubstr("sync search install remove update "
                              "list-packages completion"),
                    HasSubstr("vuru list-packages"), HasSubstr("--yes"),
                    HasSubstr("bash zsh fish")));
}

TEST(CompletionTest, ZshDescribesCommands) {
  auto script = completion::Script("zsh");
  ASSERT_TRUE(script.ok()) << script.status();

  EXPECT_THAT(*script, StartsWith("#compdef vuru\n"));
  EXPECT_THAT(*script,
              AllOf(HasSubstr("'install:Review and install packages'"),
                    HasSubstr("'(-y --yes)'{-y,--yes}"),
                    HasSubstr("'--version[Show version]'"),
                    HasSubstr("vuru list-packages")));
}

TEST(CompletionTest, FishCompletesPackagesForPackageCommands) {
  auto script = completion::Script("fish");
  ASSERT_TRUE(script.ok()) << script.status();

  EXPECT_THAT(
      *script,
      AllOf(HasSubstr("complete -c vuru -s y -l yes"),
            HasSubstr("complete -c vuru -n '__fish_seen_subcommand_from "
                      "install remove update' -a '(vuru list-packages)'"),
            HasSubstr("complete -c vuru -l color -x -a 'auto always never'")));
}

TEST(CompletionTest, RejectsUnknownShell) {
  auto script = completion::Script("powershell");

  EXPECT_TRUE(absl::IsInvalidArgument(script.status())) << script.status();
  EXPECT_THAT(script.status().message(), HasSubstr("powershell"));
}

}  // namespace

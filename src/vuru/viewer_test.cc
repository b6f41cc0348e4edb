// SPDX-License-Identifier: MIT
#include "vuru/viewer.hh"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using testing::ElementsAre;

namespace {

TEST(ViewerTest, PagerDefaultsToLess) {
  EXPECT_THAT(vuru::PagerCommand(nullptr, "/tmp/x"),
              ElementsAre("less", "/tmp/x"));
  EXPECT_THAT(vuru::PagerCommand("", "/tmp/x"), ElementsAre("less", "/tmp/x"));
  EXPECT_THAT(vuru::PagerCommand("  ", "/tmp/x"),
              ElementsAre("less", "/tmp/x"));
}

TEST(ViewerTest, PagerHonorsArguments) {
  EXPECT_THAT(vuru::PagerCommand("less -R", "/tmp/x"),
              ElementsAre("less", "-R", "/tmp/x"));
  EXPECT_THAT(vuru::PagerCommand("most", "/tmp/x"),
              ElementsAre("most", "/tmp/x"));
}

TEST(ViewerTest, DiffIsUnifiedAndLabeled) {
  EXPECT_THAT(
      vuru::DiffCommand("foo", "/tmp/old", "/tmp/new", /*color=*/false),
      ElementsAre("diff", "-u", "--color=never", "--label", "a/foo/template",
                  "--label", "b/foo/template", "/tmp/old", "/tmp/new"));

  EXPECT_THAT(vuru::DiffCommand("foo", "/tmp/old", "/tmp/new", /*color=*/true),
              testing::Contains("--color=always"));
}

}  // namespace

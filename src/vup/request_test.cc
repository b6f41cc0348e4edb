// SPDX-License-Identifier: MIT
#include "vup/request.hh"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

constexpr char kIndexUrl[] = "https://vup-linux.github.io/vup/index.json";
constexpr char kTemplateUrl[] =
    "https://example.com/srcpkgs/{category}/{name}/template";

using testing::Eq;
using testing::Optional;

TEST(RequestTest, BuildsIndexRequests) {
  vup::IndexRequest request;

  EXPECT_EQ(request.Url(kIndexUrl), kIndexUrl);
  EXPECT_EQ(request.if_none_match(), std::nullopt);
}

TEST(RequestTest, BuildsConditionalIndexRequests) {
  vup::IndexRequest request(std::string(R"(W/"etag-1")"));

  EXPECT_EQ(request.Url(kIndexUrl), kIndexUrl);
  EXPECT_THAT(request.if_none_match(), Optional(Eq(R"(W/"etag-1")")));
}

TEST(RequestTest, BuildsTemplateRequests) {
  vup::TemplateRequest request("editors", "visual-studio-code");

  EXPECT_EQ(request.category(), "editors");
  EXPECT_EQ(request.pkgname(), "visual-studio-code");
  EXPECT_EQ(request.Url(kTemplateUrl),
            "https://example.com/srcpkgs/editors/visual-studio-code/template");
}

TEST(RequestTest, UrlForTemplateEscapesComponents) {
  vup::TemplateRequest request("dev", "libc++");

  EXPECT_EQ(request.Url(kTemplateUrl),
            "https://example.com/srcpkgs/dev/libc%2B%2B/template");
}

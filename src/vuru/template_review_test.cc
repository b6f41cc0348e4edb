// SPDX-License-Identifier: MIT
#include "vuru/template_review.hh"

#include <sstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/fake_client.hh"
#include "test/fake_viewer.hh"
#include "test/scoped_temp_dir.hh"

using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;
using testing::Not;
using testing::Pair;
using vuru::ReviewKind;

namespace {

class TemplateReviewerTest : public testing::Test {
 protected:
  void SetUp() override {
    auto store = vuru::LocalStore::Open(tempdir_.path() / "vup");
    ASSERT_TRUE(store.ok()) << store.status();
    store_ = *std::move(store);
  }

  absl::StatusOr<vuru::ReviewResult> Review(const std::string& answer,
                                            const std::string& pkgname = "foo",
                                            const std::string& category =
                                                "dev") {
    input_.str(answer);
    input_.clear();

    vuru::TemplateReviewer reviewer(vuru::TemplateReviewer::Options()
                                        .set_client(&client_)
                                        .set_store(store_.get())
                                        .set_viewer(&viewer_)
                                        .set_input(&input_)
                                        .set_output(&output_));
    return reviewer.Review(pkgname, category);
  }

  std::string RecordedTemplate(const std::string& pkgname = "foo") {
    return store_->ReadTemplate(pkgname).value_or("<none>");
  }

  vuru_testing::ScopedTempDir tempdir_;
  vuru_testing::FakeClient client_;
  vuru_testing::FakeViewer viewer_;
  std::unique_ptr<vuru::LocalStore> store_;
  std::istringstream input_;
  std::ostringstream output_;
};

TEST_F(TemplateReviewerTest, NewPackageIsPaged) {
  client_.ServeTemplate("pkgname=foo\n");

  auto result = Review("\n");
  ASSERT_TRUE(result.ok()) << result.status();

  EXPECT_EQ(result->kind, ReviewKind::NEW);
  EXPECT_TRUE(result->approved);
  EXPECT_EQ(result->content, "pkgname=foo\n");

  ASSERT_EQ(viewer_.paged().size(), 1u);
  EXPECT_EQ(viewer_.paged()[0].current, "pkgname=foo\n");
  EXPECT_THAT(viewer_.diffed(), IsEmpty());
  EXPECT_THAT(client_.requested_templates(), ElementsAre(Pair("dev", "foo")));

  EXPECT_THAT(output_.str(), HasSubstr("New package foo"));
  EXPECT_THAT(output_.str(), HasSubstr("Proceed with installation? [Y/n]"));
}

TEST_F(TemplateReviewerTest, ChangedTemplateIsDiffed) {
  ASSERT_TRUE(store_->WriteTemplate("foo", "A\nB\n").ok());
  client_.ServeTemplate("A\nC\n");

  auto result = Review("y\n");
  ASSERT_TRUE(result.ok()) << result.status();

  EXPECT_EQ(result->kind, ReviewKind::CHANGED);
  EXPECT_TRUE(result->approved);
  ASSERT_EQ(viewer_.diffed().size(), 1u);
  EXPECT_EQ(viewer_.diffed()[0].previous, "A\nB\n");
  EXPECT_EQ(viewer_.diffed()[0].current, "A\nC\n");
  EXPECT_THAT(viewer_.paged(), IsEmpty());
  EXPECT_THAT(output_.str(), HasSubstr("Template for foo has changed"));
}

TEST_F(TemplateReviewerTest, UnchangedTemplateIsNotShown) {
  ASSERT_TRUE(store_->WriteTemplate("foo", "A\nB\n").ok());
  client_.ServeTemplate("A\nB\n");

  auto result = Review("yes\n");
  ASSERT_TRUE(result.ok()) << result.status();

  EXPECT_EQ(result->kind, ReviewKind::UNCHANGED);
  EXPECT_TRUE(result->approved);
  EXPECT_THAT(viewer_.paged(), IsEmpty());
  EXPECT_THAT(viewer_.diffed(), IsEmpty());
  EXPECT_THAT(output_.str(), HasSubstr("unchanged since last install"));
}

TEST_F(TemplateReviewerTest, DeclineLeavesRecordedTemplateAlone) {
  ASSERT_TRUE(store_->WriteTemplate("foo", "A\nB\n").ok());
  client_.ServeTemplate("A\nC\n");

  auto result = Review("n\n");
  ASSERT_TRUE(result.ok()) << result.status();

  EXPECT_FALSE(result->approved);
  EXPECT_EQ(RecordedTemplate(), "A\nB\n");
}

TEST_F(TemplateReviewerTest, ApprovalDoesNotWriteTheStore) {
  client_.ServeTemplate("A\nC\n");

  auto result = Review("\n");
  ASSERT_TRUE(result.ok()) << result.status();

  EXPECT_TRUE(result->approved);
  EXPECT_EQ(RecordedTemplate(), "<none>");
}

TEST_F(TemplateReviewerTest, ClosedInputIsADecline) {
  client_.ServeTemplate("A\n");

  auto result = Review("");
  ASSERT_TRUE(result.ok()) << result.status();

  EXPECT_FALSE(result->approved);
}

TEST_F(TemplateReviewerTest, FetchFailureSkipsPrompt) {
  ASSERT_TRUE(store_->WriteTemplate("foo", "A\nB\n").ok());
  client_.FailAll(absl::NotFoundError("HTTP 404"));

  auto result = Review("y\n");

  EXPECT_TRUE(absl::IsNotFound(result.status())) << result.status();
  EXPECT_THAT(result.status().message(),
              HasSubstr("failed to fetch template for foo"));
  EXPECT_THAT(output_.str(), Not(HasSubstr("Proceed")));
  EXPECT_THAT(viewer_.diffed(), IsEmpty());
  EXPECT_EQ(RecordedTemplate(), "A\nB\n");
}

TEST_F(TemplateReviewerTest, ViewerFailureSkipsPrompt) {
  client_.ServeTemplate("A\n");
  viewer_.set_status(absl::NotFoundError("failed to execute less"));

  auto result = Review("y\n");

  EXPECT_FALSE(result.ok());
  EXPECT_THAT(result.status().message(), HasSubstr("less"));
  EXPECT_THAT(output_.str(), Not(HasSubstr("Proceed")));
}

TEST_F(TemplateReviewerTest, RejectsUnsafeIdentifiersBeforeFetching) {
  client_.ServeTemplate("A\n");

  EXPECT_TRUE(absl::IsInvalidArgument(Review("y\n", "../foo").status()));
  EXPECT_TRUE(
      absl::IsInvalidArgument(Review("y\n", "foo", "dev/../../x").status()));
  EXPECT_THAT(client_.requested_templates(), IsEmpty());
}

TEST(TemplateReviewerAnswerTest, Affirmative) {
  for (const char* answer : {"", "y", "Y", "yes", "YES", "Yes", "  y  "}) {
    EXPECT_TRUE(vuru::TemplateReviewer::IsAffirmative(answer)) << answer;
  }
}

TEST(TemplateReviewerAnswerTest, Negative) {
  for (const char* answer : {"n", "no", "yy", "yes please", "q"}) {
    EXPECT_FALSE(vuru::TemplateReviewer::IsAffirmative(answer)) << answer;
  }
}

}  // namespace

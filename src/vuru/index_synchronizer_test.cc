// SPDX-License-Identifier: MIT
#include "vuru/index_synchronizer.hh"

#include <filesystem>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/fake_client.hh"
#include "test/scoped_temp_dir.hh"

namespace fs = std::filesystem;

using testing::ElementsAre;
using testing::Eq;
using testing::Field;
using testing::HasSubstr;
using testing::Optional;
using testing::Pointee;
using vuru::SyncSource;

namespace {

constexpr char kFooIndex[] =
    R"({"foo": {"category":"dev","version":"1.0","repo_url":"http://x"}})";
constexpr char kFooBarIndex[] = R"({
  "foo": {"category":"dev","version":"1.1","repo_url":"http://x"},
  "bar": {"category":"net","version":"0.2","repo_url":"http://y"}
})";

class IndexSynchronizerTest : public testing::Test {
 protected:
  void SetUp() override {
    auto store = vuru::LocalStore::Open(tempdir_.path() / "vup");
    ASSERT_TRUE(store.ok()) << store.status();
    store_ = *std::move(store);
  }

  vuru::IndexSynchronizer MakeSynchronizer() {
    return vuru::IndexSynchronizer(vuru::IndexSynchronizer::Options()
                                       .set_client(&client_)
                                       .set_store(store_.get()));
  }

  fs::file_time_type IndexMtime() const {
    return fs::last_write_time(store_->index_path());
  }

  vuru_testing::ScopedTempDir tempdir_;
  vuru_testing::FakeClient client_;
  std::unique_ptr<vuru::LocalStore> store_;
};

TEST_F(IndexSynchronizerTest, FetchesAndCachesWhenNothingIsCached) {
  client_.ServeIndex(kFooIndex, "etag-1");
  auto synchronizer = MakeSynchronizer();

  SyncSource source;
  auto directory = synchronizer.Sync(/*force_refresh=*/false, &source);
  ASSERT_TRUE(directory.ok()) << directory.status();

  EXPECT_EQ(source, SyncSource::FETCHED);
  EXPECT_EQ(client_.index_requests(), 1);
  EXPECT_EQ(client_.last_if_none_match(), std::nullopt);
  EXPECT_THAT(directory->Lookup("foo"),
              Pointee(Field(&vup::Package::version, "1.0")));

  auto bytes = store_->ReadIndex();
  ASSERT_TRUE(bytes.ok()) << bytes.status();
  EXPECT_EQ(*bytes, kFooIndex);
  EXPECT_THAT(store_->ReadFreshnessToken(), Optional(Eq("etag-1")));
}

TEST_F(IndexSynchronizerTest, SecondSyncIsServedFromCache) {
  client_.ServeIndex(kFooBarIndex, "etag-1");
  auto synchronizer = MakeSynchronizer();

  auto first = synchronizer.Sync(/*force_refresh=*/false);
  ASSERT_TRUE(first.ok()) << first.status();

  SyncSource source;
  auto second = synchronizer.Sync(/*force_refresh=*/false, &source);
  ASSERT_TRUE(second.ok()) << second.status();

  EXPECT_EQ(source, SyncSource::CACHE);
  EXPECT_EQ(client_.index_requests(), 1);
  EXPECT_EQ(first->index(), second->index());
}

TEST_F(IndexSynchronizerTest, NotModifiedReusesCacheWithoutRewriting) {
  ASSERT_TRUE(store_->WriteIndex(kFooIndex, "etag-1").ok());
  const auto mtime = IndexMtime();
  client_.ServeIndexConditionally(kFooBarIndex, "etag-1");
  auto synchronizer = MakeSynchronizer();

  SyncSource source;
  auto directory = synchronizer.Sync(/*force_refresh=*/true, &source);
  ASSERT_TRUE(directory.ok()) << directory.status();

  EXPECT_EQ(source, SyncSource::NOT_MODIFIED);
  EXPECT_THAT(client_.last_if_none_match(), Optional(Eq("etag-1")));
  EXPECT_THAT(directory->Names(), ElementsAre("foo"));
  EXPECT_THAT(directory->Lookup("foo"),
              Pointee(Field(&vup::Package::version, "1.0")));

  EXPECT_EQ(IndexMtime(), mtime);
  auto bytes = store_->ReadIndex();
  ASSERT_TRUE(bytes.ok()) << bytes.status();
  EXPECT_EQ(*bytes, kFooIndex);
}

TEST_F(IndexSynchronizerTest, ForcedRefreshReplacesCacheWholesale) {
  ASSERT_TRUE(store_->WriteIndex(kFooIndex, "etag-1").ok());
  client_.ServeIndexConditionally(kFooBarIndex, "etag-2");
  auto synchronizer = MakeSynchronizer();

  SyncSource source;
  auto directory = synchronizer.Sync(/*force_refresh=*/true, &source);
  ASSERT_TRUE(directory.ok()) << directory.status();

  EXPECT_EQ(source, SyncSource::FETCHED);
  EXPECT_THAT(directory->Names(), ElementsAre("bar", "foo"));
  EXPECT_THAT(store_->ReadFreshnessToken(), Optional(Eq("etag-2")));

  auto cached = synchronizer.LoadCached();
  ASSERT_TRUE(cached.ok()) << cached.status();
  EXPECT_EQ(*cached, directory->index());
}

TEST_F(IndexSynchronizerTest, FetchWithoutEtagDropsOldToken) {
  ASSERT_TRUE(store_->WriteIndex(kFooIndex, "etag-1").ok());
  client_.ServeIndex(kFooBarIndex);
  auto synchronizer = MakeSynchronizer();

  auto directory = synchronizer.Sync(/*force_refresh=*/true);
  ASSERT_TRUE(directory.ok()) << directory.status();

  EXPECT_EQ(store_->ReadFreshnessToken(), std::nullopt);
}

TEST_F(IndexSynchronizerTest, FailedRefreshFallsBackToCache) {
  ASSERT_TRUE(store_->WriteIndex(kFooIndex, "etag-1").ok());
  const auto mtime = IndexMtime();
  client_.FailAll(absl::UnavailableError("Could not resolve host"));
  auto synchronizer = MakeSynchronizer();

  SyncSource source;
  auto directory = synchronizer.Sync(/*force_refresh=*/true, &source);
  ASSERT_TRUE(directory.ok()) << directory.status();

  EXPECT_EQ(source, SyncSource::STALE_CACHE);
  EXPECT_EQ(client_.index_requests(), 1);
  EXPECT_THAT(directory->Names(), ElementsAre("foo"));

  EXPECT_EQ(IndexMtime(), mtime);
  EXPECT_THAT(store_->ReadFreshnessToken(), Optional(Eq("etag-1")));
}

TEST_F(IndexSynchronizerTest, UndecodablePayloadNeverReachesCache) {
  ASSERT_TRUE(store_->WriteIndex(kFooIndex, "etag-1").ok());
  client_.ServeIndex(R"({"foo": "garbage"})", "etag-2");
  auto synchronizer = MakeSynchronizer();

  SyncSource source;
  auto directory = synchronizer.Sync(/*force_refresh=*/true, &source);
  ASSERT_TRUE(directory.ok()) << directory.status();

  EXPECT_EQ(source, SyncSource::STALE_CACHE);
  EXPECT_THAT(directory->Lookup("foo"),
              Pointee(Field(&vup::Package::version, "1.0")));

  auto bytes = store_->ReadIndex();
  ASSERT_TRUE(bytes.ok()) << bytes.status();
  EXPECT_EQ(*bytes, kFooIndex);
  EXPECT_THAT(store_->ReadFreshnessToken(), Optional(Eq("etag-1")));
}

TEST_F(IndexSynchronizerTest, NoCacheAndNoNetworkIsUnavailable) {
  client_.FailAll(absl::UnavailableError("Could not resolve host"));
  auto synchronizer = MakeSynchronizer();

  auto directory = synchronizer.Sync(/*force_refresh=*/false);

  EXPECT_TRUE(absl::IsUnavailable(directory.status())) << directory.status();
  EXPECT_THAT(directory.status().message(), HasSubstr("no cache"));
  EXPECT_FALSE(fs::exists(store_->index_path()));
  EXPECT_FALSE(fs::exists(store_->token_path()));
}

TEST_F(IndexSynchronizerTest, CorruptCacheIsRefetched) {
  ASSERT_TRUE(store_->WriteIndex("{not json", "etag-1").ok());
  client_.ServeIndexConditionally(kFooIndex, "etag-1");
  auto synchronizer = MakeSynchronizer();

  EXPECT_TRUE(absl::IsDataLoss(synchronizer.LoadCached().status()));

  SyncSource source;
  auto directory = synchronizer.Sync(/*force_refresh=*/false, &source);
  ASSERT_TRUE(directory.ok()) << directory.status();

  // The token belonged to the corrupt bytes, so it must not be sent.
  EXPECT_EQ(client_.last_if_none_match(), std::nullopt);
  EXPECT_EQ(source, SyncSource::FETCHED);
  EXPECT_THAT(directory->Names(), ElementsAre("foo"));
}

TEST_F(IndexSynchronizerTest, CorruptCacheAndNoNetworkIsUnavailable) {
  ASSERT_TRUE(store_->WriteIndex("[]", std::nullopt).ok());
  client_.FailAll(absl::InternalError("HTTP 500"));
  auto synchronizer = MakeSynchronizer();

  auto directory = synchronizer.Sync(/*force_refresh=*/false);

  EXPECT_TRUE(absl::IsUnavailable(directory.status())) << directory.status();
}

TEST_F(IndexSynchronizerTest, NotModifiedWithoutUsableCacheIsUnavailable) {
  client_.set_index_handler([](const vup::IndexRequest&)
                                -> absl::StatusOr<vup::IndexResponse> {
    return vup::IndexResponse::NotModified();
  });
  auto synchronizer = MakeSynchronizer();

  auto directory = synchronizer.Sync(/*force_refresh=*/true);

  EXPECT_TRUE(absl::IsUnavailable(directory.status())) << directory.status();
  EXPECT_FALSE(fs::exists(store_->index_path()));
}

}  // namespace

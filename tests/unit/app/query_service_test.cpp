#include <pictor/app/query_service.hpp>
#include <pictor/storage/sqlite_item_repository.hpp>
#include "support/fakes.hpp"
#include "support/test_images.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace pa = pictor::app;
namespace pc = pictor::core;
namespace ps = pictor::storage;
namespace pt = pictor::testing;

namespace {

constexpr const char* kBase = "http://localhost:8000";

class QueryServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    repo_ = std::make_unique<ps::SqliteItemRepository>((dir_ / "app.db").string());
    ASSERT_TRUE(repo_->initialize_schema().has_value());
    query_ = std::make_unique<pa::QueryService>(*repo_, blobs_);
  }

  void insert(const std::string& id, const std::string& created_at) {
    pc::Item item;
    item.id = id;
    item.original_name = id + ".jpg";
    item.mime_type = "image/jpeg";
    item.size_bytes = 1234;
    item.stored_ref = "mem://" + id + "/original.jpg";
    item.created_at = created_at;
    ASSERT_TRUE(repo_->insert(item).has_value());
  }

  /// Completes id as Succeeded with thumbnails stored in the blob store.
  void succeed(const std::string& id, std::int64_t ms) {
    pc::SuccessOutcome ok;
    ok.width = 640;
    ok.height = 480;
    ok.format = "JPEG";
    ok.caption = "a red square";
    for (auto variant : {pc::ThumbnailVariant::Small, pc::ThumbnailVariant::Medium}) {
      auto ref = blobs_.put({id, std::string(pc::to_string(variant)), ".jpg"},
                            pt::to_bytes("thumb"));
      ASSERT_TRUE(ref.has_value());
      ok.thumbnail_refs[variant] = *ref;
    }
    pc::TerminalUpdate update{ok, "2026-01-01T00:00:05Z", ms};
    ASSERT_TRUE(repo_->complete(id, update).has_value());
  }

  void fail(const std::string& id, std::int64_t ms) {
    pc::TerminalUpdate update{pc::FailureOutcome{"decode: cannot identify image file"},
                              "2026-01-01T00:00:05Z", ms};
    ASSERT_TRUE(repo_->complete(id, update).has_value());
  }

  pt::TempDir dir_;
  std::unique_ptr<ps::SqliteItemRepository> repo_;
  pt::InMemoryBlobStore blobs_;
  std::unique_ptr<pa::QueryService> query_;
};

}  // namespace

TEST(FormatSuccessRate, TwoDecimalsWithPercent) {
  EXPECT_EQ(pa::format_success_rate(0, 0), "0.00%");
  EXPECT_EQ(pa::format_success_rate(1, 1), "100.00%");
  EXPECT_EQ(pa::format_success_rate(1, 3), "33.33%");
  EXPECT_EQ(pa::format_success_rate(2, 3), "66.67%");
}

TEST(Project, ProcessingItemHasNoMetadataOrError) {
  pc::Item item;
  item.id = "p";
  item.original_name = "p.png";
  const pa::ItemView view = pa::project(item, kBase);
  EXPECT_EQ(view.status, pc::ItemStatus::Processing);
  EXPECT_FALSE(view.metadata.has_value());
  EXPECT_TRUE(view.thumbnails.empty());
  EXPECT_FALSE(view.error.has_value());
  EXPECT_FALSE(view.processed_at.has_value());
}

TEST(Project, SucceededItemExposesMetadataAndUrls) {
  pc::Item item;
  item.id = "s";
  item.original_name = "s.jpg";
  item.size_bytes = 42;
  item.status = pc::ItemStatus::Succeeded;
  item.width = 10;
  item.height = 20;
  item.format = "PNG";
  item.caption = "a cat";
  item.completed_at = "2026-01-01T00:00:00Z";
  item.thumbnail_refs = {{pc::ThumbnailVariant::Small, "x"}, {pc::ThumbnailVariant::Medium, "y"}};

  const pa::ItemView view = pa::project(item, kBase);
  ASSERT_TRUE(view.metadata.has_value());
  EXPECT_EQ(view.metadata->width, 10u);
  EXPECT_EQ(view.metadata->height, 20u);
  EXPECT_EQ(view.metadata->format, "png");
  EXPECT_EQ(view.metadata->size_bytes, 42);
  EXPECT_EQ(view.metadata->caption, "a cat");
  EXPECT_EQ(view.thumbnails.at("small"), "http://localhost:8000/api/images/s/thumbnails/small");
  EXPECT_EQ(view.thumbnails.at("medium"), "http://localhost:8000/api/images/s/thumbnails/medium");
  EXPECT_EQ(view.processed_at, "2026-01-01T00:00:00Z");
  EXPECT_FALSE(view.error.has_value());
}

TEST(Project, FailedItemExposesOnlyError) {
  pc::Item item;
  item.id = "f";
  item.status = pc::ItemStatus::Failed;
  item.error = "boom";
  item.completed_at = "2026-01-01T00:00:00Z";
  const pa::ItemView view = pa::project(item, kBase);
  EXPECT_EQ(view.error, "boom");
  EXPECT_FALSE(view.metadata.has_value());
  EXPECT_TRUE(view.thumbnails.empty());
}

TEST_F(QueryServiceTest, ListIsNewestFirst) {
  insert("old", "2026-01-01T00:00:00Z");
  insert("new", "2026-01-02T00:00:00Z");
  auto views = query_->list(kBase);
  ASSERT_TRUE(views.has_value());
  ASSERT_EQ(views->size(), 2u);
  EXPECT_EQ((*views)[0].image_id, "new");
  EXPECT_EQ((*views)[1].image_id, "old");
}

TEST_F(QueryServiceTest, GetUnknownIsNotFound) {
  auto r = query_->get("nope", kBase);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, pc::ErrorCode::NotFound);
  EXPECT_EQ(r.error().message, "Image not found.");
}

TEST_F(QueryServiceTest, GetSucceededItem) {
  insert("a", "2026-01-01T00:00:00Z");
  succeed("a", 1500);
  auto view = query_->get("a", kBase);
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->status, pc::ItemStatus::Succeeded);
  ASSERT_TRUE(view->metadata.has_value());
  EXPECT_EQ(view->metadata->format, "jpg");
  EXPECT_EQ(view->metadata->size_bytes, 1234);
  EXPECT_EQ(view->thumbnails.size(), 2u);
}

TEST_F(QueryServiceTest, ThumbnailOfUnknownItemIsNotFound) {
  auto r = query_->thumbnail("nope", "small");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, pc::ErrorCode::NotFound);
}

TEST_F(QueryServiceTest, ThumbnailOfProcessingItemIsConflictForAnyVariant) {
  insert("p", "2026-01-01T00:00:00Z");
  for (const char* variant : {"small", "medium", "huge"}) {
    auto r = query_->thumbnail("p", variant);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, pc::ErrorCode::Conflict) << variant;
  }
}

TEST_F(QueryServiceTest, ThumbnailOfFailedItemIsConflict) {
  insert("f", "2026-01-01T00:00:00Z");
  fail("f", 10);
  auto r = query_->thumbnail("f", "small");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, pc::ErrorCode::Conflict);
  EXPECT_EQ(r.error().message, "Thumbnails not ready (processing not successful).");
}

TEST_F(QueryServiceTest, UnknownVariantOfSucceededItemIsValidation) {
  insert("a", "2026-01-01T00:00:00Z");
  succeed("a", 10);
  auto r = query_->thumbnail("a", "large");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, pc::ErrorCode::Validation);
}

TEST_F(QueryServiceTest, ThumbnailBytesAreServedAsJpeg) {
  insert("a", "2026-01-01T00:00:00Z");
  succeed("a", 10);
  auto r = query_->thumbnail("a", "medium");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->content_type, "image/jpeg");
  EXPECT_TRUE(r->bytes == pt::to_bytes("thumb"));
}

TEST_F(QueryServiceTest, MissingThumbnailBlobIsNotFound) {
  insert("a", "2026-01-01T00:00:00Z");
  succeed("a", 10);
  ASSERT_TRUE(blobs_.remove("mem://a/small.jpg").has_value());
  auto r = query_->thumbnail("a", "small");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, pc::ErrorCode::NotFound);
  EXPECT_EQ(r.error().message, "Thumbnail not found.");
}

TEST_F(QueryServiceTest, StatsOnEmptyRepository) {
  auto stats = query_->stats();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->total, 0);
  EXPECT_EQ(stats->failed, 0);
  EXPECT_EQ(stats->success_rate, "0.00%");
  EXPECT_DOUBLE_EQ(stats->average_processing_time_seconds, 0.0);
}

TEST_F(QueryServiceTest, StatsCountProcessingInTotalOnly) {
  insert("a", "2026-01-01T00:00:00Z");
  insert("b", "2026-01-01T00:00:01Z");
  insert("c", "2026-01-01T00:00:02Z");
  succeed("a", 1000);
  fail("b", 3000);

  auto stats = query_->stats();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->total, 3);
  EXPECT_EQ(stats->failed, 1);
  EXPECT_EQ(stats->success_rate, "33.33%");
  EXPECT_DOUBLE_EQ(stats->average_processing_time_seconds, 2.0);
}

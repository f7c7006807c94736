#include <pictor/core/error.hpp>
#include <pictor/core/item.hpp>
#include <pictor/core/timestamp.hpp>
#include <gtest/gtest.h>
#include <chrono>

namespace pc = pictor::core;

namespace {

pc::Item processing_item() {
  pc::Item item;
  item.id = "abc";
  item.original_name = "cat.jpg";
  item.mime_type = "image/jpeg";
  item.size_bytes = 1234;
  item.stored_ref = "/data/originals/abc.jpg";
  item.created_at = "2024-05-01T12:00:00Z";
  return item;
}

pc::Item succeeded_item() {
  pc::Item item = processing_item();
  item.status = pc::ItemStatus::Succeeded;
  item.width = 640;
  item.height = 480;
  item.format = "JPEG";
  item.caption = "a cat";
  item.thumbnail_refs[pc::ThumbnailVariant::Small] = "/t/abc_small.jpg";
  item.thumbnail_refs[pc::ThumbnailVariant::Medium] = "/t/abc_medium.jpg";
  item.completed_at = "2024-05-01T12:00:01Z";
  item.processing_ms = 950;
  return item;
}

}  // namespace

TEST(ItemStatus, TokensMatchPersistedValues) {
  EXPECT_EQ(pc::to_string(pc::ItemStatus::Processing), "processing");
  EXPECT_EQ(pc::to_string(pc::ItemStatus::Succeeded), "success");
  EXPECT_EQ(pc::to_string(pc::ItemStatus::Failed), "failed");
  EXPECT_EQ(pc::parse_item_status("success"), pc::ItemStatus::Succeeded);
  EXPECT_EQ(pc::parse_item_status("failed"), pc::ItemStatus::Failed);
  EXPECT_FALSE(pc::parse_item_status("done").has_value());
}

TEST(ItemStatus, OnlySucceededAndFailedAreTerminal) {
  EXPECT_FALSE(pc::is_terminal(pc::ItemStatus::Processing));
  EXPECT_TRUE(pc::is_terminal(pc::ItemStatus::Succeeded));
  EXPECT_TRUE(pc::is_terminal(pc::ItemStatus::Failed));
}

TEST(ThumbnailVariant, ParsesOnlyKnownNames) {
  EXPECT_EQ(pc::parse_thumbnail_variant("small"), pc::ThumbnailVariant::Small);
  EXPECT_EQ(pc::parse_thumbnail_variant("medium"), pc::ThumbnailVariant::Medium);
  EXPECT_FALSE(pc::parse_thumbnail_variant("large").has_value());
  EXPECT_FALSE(pc::parse_thumbnail_variant("Small").has_value());
  EXPECT_EQ(pc::to_string(pc::ThumbnailVariant::Medium), "medium");
}

TEST(Item, FreshItemIsConsistentProcessing) {
  EXPECT_TRUE(pc::lifecycle_consistent(processing_item()));
}

TEST(Item, ProcessingWithTerminalFieldIsInconsistent) {
  pc::Item item = processing_item();
  item.completed_at = "2024-05-01T12:00:01Z";
  EXPECT_FALSE(pc::lifecycle_consistent(item));

  item = processing_item();
  item.caption = "early";
  EXPECT_FALSE(pc::lifecycle_consistent(item));
}

TEST(Item, SucceededRequiresEverySuccessField) {
  EXPECT_TRUE(pc::lifecycle_consistent(succeeded_item()));

  pc::Item missing_thumb = succeeded_item();
  missing_thumb.thumbnail_refs.erase(pc::ThumbnailVariant::Medium);
  EXPECT_FALSE(pc::lifecycle_consistent(missing_thumb));

  pc::Item with_error = succeeded_item();
  with_error.error = "boom";
  EXPECT_FALSE(pc::lifecycle_consistent(with_error));
}

TEST(Item, FailedRequiresErrorAndNoSuccessField) {
  pc::Item item = processing_item();
  item.status = pc::ItemStatus::Failed;
  item.error = "decode: cannot identify image format";
  item.completed_at = "2024-05-01T12:00:01Z";
  item.processing_ms = 3;
  EXPECT_TRUE(pc::lifecycle_consistent(item));

  item.width = 10;
  EXPECT_FALSE(pc::lifecycle_consistent(item));

  item.width.reset();
  item.error = "";
  EXPECT_FALSE(pc::lifecycle_consistent(item));
}

TEST(TerminalUpdate, StatusFollowsOutcome) {
  pc::TerminalUpdate ok;
  ok.outcome = pc::SuccessOutcome{};
  EXPECT_EQ(ok.status(), pc::ItemStatus::Succeeded);

  pc::TerminalUpdate failed;
  failed.outcome = pc::FailureOutcome{"x"};
  EXPECT_EQ(failed.status(), pc::ItemStatus::Failed);
}

TEST(Error, CodeNames) {
  EXPECT_EQ(pc::to_string(pc::ErrorCode::Validation), "validation");
  EXPECT_EQ(pc::to_string(pc::ErrorCode::NotFound), "not_found");
  EXPECT_EQ(pc::to_string(pc::ErrorCode::StageFailure), "stage_failure");
  const pc::Error e = pc::make_error(pc::ErrorCode::Conflict, "already success");
  EXPECT_EQ(e.code, pc::ErrorCode::Conflict);
  EXPECT_EQ(e.message, "already success");
}

TEST(Timestamp, FormatsUtcWithZuluSuffix) {
  const auto epoch_plus = std::chrono::system_clock::time_point{} + std::chrono::seconds(86400 + 3661);
  EXPECT_EQ(pc::format_utc(epoch_plus), "1970-01-02T01:01:01Z");
  EXPECT_EQ(pc::utc_now_iso().size(), 20u);
}

#include <pictor/app/ingest_service.hpp>
#include <pictor/storage/sqlite_item_repository.hpp>
#include "support/fakes.hpp"
#include "support/test_images.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace pa = pictor::app;
namespace pc = pictor::core;
namespace ps = pictor::storage;
namespace pt = pictor::testing;

namespace {

/// Records submitted ids without running anything.
class RecordingDispatcher : public pa::IJobDispatcher {
 public:
  std::expected<void, pc::Error> submit(std::string item_id) override {
    if (closed) {
      return std::unexpected(pc::make_error(pc::ErrorCode::Unavailable, "dispatcher is shut down"));
    }
    submitted.push_back(std::move(item_id));
    return {};
  }
  void wait_idle() override {}
  void shutdown() override { closed = true; }

  std::vector<std::string> submitted;
  bool closed{false};
};

class IngestServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    repo_ = std::make_unique<ps::SqliteItemRepository>((dir_ / "app.db").string());
    ASSERT_TRUE(repo_->initialize_schema().has_value());
    faulty_ = std::make_unique<pt::FaultyRepository>(*repo_);
    service_ = std::make_unique<pa::IngestService>(*faulty_, blobs_, dispatcher_,
                                                   [this] { return "id-" + std::to_string(++n_); });
  }

  pa::UploadRequest upload(const std::string& content_type) {
    return pa::UploadRequest{"cat.jpg", content_type, payload_};
  }

  pt::TempDir dir_;
  std::unique_ptr<ps::SqliteItemRepository> repo_;
  std::unique_ptr<pt::FaultyRepository> faulty_;
  pt::InMemoryBlobStore blobs_;
  RecordingDispatcher dispatcher_;
  std::unique_ptr<pa::IngestService> service_;
  pc::Bytes payload_ = pt::make_jpeg(64, 48);
  int n_{0};
};

}  // namespace

TEST(ExtensionForContentType, AcceptsJpegAndPngOnly) {
  EXPECT_EQ(pa::extension_for_content_type("image/jpeg"), ".jpg");
  EXPECT_EQ(pa::extension_for_content_type("image/png"), ".png");
  EXPECT_EQ(pa::extension_for_content_type("IMAGE/PNG"), ".png");
  EXPECT_EQ(pa::extension_for_content_type(" image/jpeg ; charset=binary"), ".jpg");
  EXPECT_EQ(pa::extension_for_content_type("image/gif"), "");
  EXPECT_EQ(pa::extension_for_content_type("text/plain"), "");
  EXPECT_EQ(pa::extension_for_content_type(""), "");
}

TEST(GenerateItemId, IsVersion4Uuid) {
  const std::string id = pa::generate_item_id();
  ASSERT_EQ(id.size(), 36u);
  EXPECT_EQ(id[8], '-');
  EXPECT_EQ(id[13], '-');
  EXPECT_EQ(id[18], '-');
  EXPECT_EQ(id[23], '-');
  EXPECT_EQ(id[14], '4');
  EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
  EXPECT_NE(id, pa::generate_item_id());
}

TEST_F(IngestServiceTest, AcceptedUploadIsProcessingAndSubmitted) {
  auto accepted = service_->accept(upload("image/jpeg"));
  ASSERT_TRUE(accepted.has_value()) << accepted.error().message;
  EXPECT_EQ(accepted->id, "id-1");
  EXPECT_EQ(accepted->status, pc::ItemStatus::Processing);

  auto found = repo_->find("id-1");
  ASSERT_TRUE(found.has_value());
  ASSERT_TRUE(found->has_value());
  const pc::Item& item = **found;
  EXPECT_EQ(item.status, pc::ItemStatus::Processing);
  EXPECT_EQ(item.original_name, "cat.jpg");
  EXPECT_EQ(item.mime_type, "image/jpeg");
  EXPECT_EQ(item.size_bytes, static_cast<std::int64_t>(payload_.size()));
  EXPECT_FALSE(item.created_at.empty());
  EXPECT_TRUE(pc::lifecycle_consistent(item));

  auto stored = blobs_.read(item.stored_ref);
  ASSERT_TRUE(stored.has_value());
  EXPECT_TRUE(*stored == payload_);
  EXPECT_EQ(item.stored_ref, "mem://id-1/original.jpg");

  ASSERT_EQ(dispatcher_.submitted.size(), 1u);
  EXPECT_EQ(dispatcher_.submitted[0], "id-1");
}

TEST_F(IngestServiceTest, PngKeepsPngExtension) {
  auto accepted = service_->accept(upload("image/png"));
  ASSERT_TRUE(accepted.has_value());
  EXPECT_EQ(blobs_.count_containing("original.png"), 1u);
}

TEST_F(IngestServiceTest, UnsupportedTypeIsRejectedWithoutSideEffects) {
  auto r = service_->accept(upload("text/plain"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, pc::ErrorCode::Validation);
  EXPECT_EQ(r.error().message, "Only JPG and PNG are allowed.");

  EXPECT_EQ(blobs_.count_containing("mem://"), 0u);
  EXPECT_TRUE(dispatcher_.submitted.empty());
  auto counts = repo_->counts();
  ASSERT_TRUE(counts.has_value());
  EXPECT_EQ(counts->total, 0);
}

TEST_F(IngestServiceTest, EmptyPayloadIsRejected) {
  pa::UploadRequest empty{"empty.png", "image/png", {}};
  auto r = service_->accept(empty);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, pc::ErrorCode::Validation);
  EXPECT_EQ(blobs_.count_containing("mem://"), 0u);
}

TEST_F(IngestServiceTest, ContentIsNotSniffed) {
  // Declared type decides acceptance; undecodable bytes fail later in the pipeline.
  const pc::Bytes text = pt::to_bytes("not an image at all");
  auto r = service_->accept(pa::UploadRequest{"fake.jpg", "image/jpeg", text});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(dispatcher_.submitted.size(), 1u);
}

TEST_F(IngestServiceTest, BlobFailureLeavesNoRow) {
  blobs_.fail_variants.insert("original");
  auto r = service_->accept(upload("image/jpeg"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, pc::ErrorCode::BlobStore);
  auto counts = repo_->counts();
  ASSERT_TRUE(counts.has_value());
  EXPECT_EQ(counts->total, 0);
  EXPECT_TRUE(dispatcher_.submitted.empty());
}

TEST_F(IngestServiceTest, InsertFailureRemovesStoredOriginal) {
  faulty_->fail_insert = true;
  auto r = service_->accept(upload("image/jpeg"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, pc::ErrorCode::Repository);
  EXPECT_EQ(blobs_.count_containing("mem://"), 0u);
  EXPECT_TRUE(dispatcher_.submitted.empty());
}

TEST_F(IngestServiceTest, ClosedDispatcherMarksItemFailed) {
  dispatcher_.shutdown();
  auto r = service_->accept(upload("image/jpeg"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, pc::ErrorCode::Unavailable);

  auto found = repo_->find("id-1");
  ASSERT_TRUE(found.has_value());
  ASSERT_TRUE(found->has_value());
  EXPECT_EQ((*found)->status, pc::ItemStatus::Failed);
  EXPECT_EQ((*found)->error, "job dispatcher unavailable");
  EXPECT_TRUE(pc::lifecycle_consistent(**found));
  EXPECT_FALSE((*found)->processing_ms.has_value());
}

TEST_F(IngestServiceTest, RefusedJobDoesNotSkewAverageDuration) {
  dispatcher_.shutdown();
  ASSERT_FALSE(service_->accept(upload("image/jpeg")).has_value());

  auto counts = repo_->counts();
  ASSERT_TRUE(counts.has_value());
  EXPECT_EQ(counts->total, 1);
  EXPECT_EQ(counts->failed, 1);
  EXPECT_FALSE(counts->average_processing_ms.has_value());
}

TEST_F(IngestServiceTest, EachUploadGetsItsOwnId) {
  auto a = service_->accept(upload("image/jpeg"));
  auto b = service_->accept(upload("image/jpeg"));
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_NE(a->id, b->id);
  EXPECT_EQ(dispatcher_.submitted.size(), 2u);
}

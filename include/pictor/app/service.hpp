#pragma once

#include <pictor/app/config.hpp>
#include <pictor/app/coordinator.hpp>
#include <pictor/app/ingest_service.hpp>
#include <pictor/app/job_dispatcher.hpp>
#include <pictor/app/query_service.hpp>
#include <pictor/core/pipeline.hpp>
#include <pictor/storage/local_fs_blob_store.hpp>
#include <pictor/storage/sqlite_item_repository.hpp>
#include <pictor/vision/caption_backend.hpp>
#include <pictor/vision/captioner.hpp>
#include <memory>

namespace pictor::app {

/// Mock or ONNX caption backend as configured. Throws if the ONNX models or vocabulary
/// cannot be loaded.
[[nodiscard]] std::unique_ptr<pictor::vision::ICaptionBackend>
make_caption_backend(const ServiceConfig& config);

/// decode -> metadata -> thumbnails -> caption.
[[nodiscard]] std::unique_ptr<pictor::core::Pipeline>
build_pipeline(std::shared_ptr<pictor::vision::Captioner> captioner);

/// Thread pool or oneTBB dispatcher as configured.
[[nodiscard]] std::unique_ptr<IJobDispatcher>
make_dispatcher(const ServiceConfig& config, JobHandler handler);

/// Create the data directories and the schema. Idempotent.
[[nodiscard]] std::expected<void, pictor::core::Error> initialize_storage(const ServiceConfig& config);

/// Everything a running process needs, wired once at startup.
/// Members are declared in dependency order; the dispatcher is shut down (draining
/// queued jobs) before the coordinator and stores it uses are destroyed.
class PictorService {
 public:
  /// Throws std::runtime_error if storage cannot be opened or initialized, or if the
  /// caption backend cannot be created.
  explicit PictorService(const ServiceConfig& config);
  ~PictorService();

  PictorService(const PictorService&) = delete;
  PictorService& operator=(const PictorService&) = delete;

  [[nodiscard]] IngestService& ingest() noexcept { return *ingest_; }
  [[nodiscard]] const QueryService& query() const noexcept { return *query_; }
  [[nodiscard]] IJobDispatcher& dispatcher() noexcept { return *dispatcher_; }

 private:
  storage::SqliteItemRepository repository_;
  storage::LocalFsBlobStore blobs_;
  std::shared_ptr<pictor::vision::Captioner> captioner_;
  std::unique_ptr<pictor::core::Pipeline> pipeline_;
  std::unique_ptr<PipelineCoordinator> coordinator_;
  std::unique_ptr<IJobDispatcher> dispatcher_;
  std::unique_ptr<IngestService> ingest_;
  std::unique_ptr<QueryService> query_;
};

}  // namespace pictor::app

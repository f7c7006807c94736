#include <pictor/app/service.hpp>
#include <pictor/app/job_dispatcher_tbb.hpp>
#include <pictor/vision/caption_stage.hpp>
#include <pictor/vision/image_codec.hpp>
#include <pictor/vision/metadata_stage.hpp>
#include <pictor/vision/mock_caption_backend.hpp>
#include <pictor/vision/onnx_caption_backend.hpp>
#include <pictor/vision/thumbnail_stage.hpp>
#include <pictor/vision/wordpiece_vocab.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace pictor::app {

namespace pv = pictor::vision;

namespace {

/// Resolved database path with its parent directory created.
std::string prepared_db_path(const ServiceConfig& config) {
  const std::string path = config.resolved_db_path();
  const auto parent = std::filesystem::path(path).parent_path();
  std::error_code ec;
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  if (ec) throw std::runtime_error("cannot create " + parent.string() + ": " + ec.message());
  return path;
}

}  // namespace

std::unique_ptr<pv::ICaptionBackend> make_caption_backend(const ServiceConfig& config) {
  if (config.caption_backend == CaptionBackendType::Onnx) {
    auto vocab = pv::WordPieceVocab::load(config.caption_vocab_path);
    if (!vocab) throw std::runtime_error(vocab.error().message);
    pv::OnnxCaptionOptions options;
    options.max_new_tokens = config.caption_max_new_tokens;
    auto onnx = std::make_unique<pv::OnnxCaptionBackend>(
        config.caption_encoder_path, config.caption_decoder_path, std::move(*vocab), options);
    onnx->warmup();
    spdlog::info("caption model loaded from {}", config.caption_encoder_path);
    return onnx;
  }
  return std::make_unique<pv::MockCaptionBackend>(config.mock_caption);
}

std::unique_ptr<pictor::core::Pipeline> build_pipeline(std::shared_ptr<pv::Captioner> captioner) {
  auto pipeline = std::make_unique<pictor::core::Pipeline>(
      [](std::span<const std::byte> bytes) { return pv::decode_image(bytes); });
  pipeline->add_stage(std::make_unique<pv::MetadataStage>());
  pipeline->add_stage(std::make_unique<pv::ThumbnailStage>());
  pipeline->add_stage(std::make_unique<pv::CaptionStage>(std::move(captioner)));
  return pipeline;
}

std::unique_ptr<IJobDispatcher> make_dispatcher(const ServiceConfig& config, JobHandler handler) {
#ifdef PICTOR_HAS_TBB
  if (config.dispatcher == DispatcherType::Tbb) {
    return std::make_unique<TbbJobDispatcher>(std::move(handler), config.workers);
  }
#endif
  return std::make_unique<ThreadPoolJobDispatcher>(std::move(handler), config.workers);
}

std::expected<void, pictor::core::Error> initialize_storage(const ServiceConfig& config) {
  storage::LocalFsBlobStore blobs(config.resolved_originals_dir(), config.resolved_thumbs_dir());
  if (auto dirs = blobs.ensure_dirs(); !dirs) return dirs;
  try {
    storage::SqliteItemRepository repository(prepared_db_path(config));
    return repository.initialize_schema();
  } catch (const std::exception& e) {
    return std::unexpected(
        pictor::core::make_error(pictor::core::ErrorCode::Repository, e.what()));
  }
}

PictorService::PictorService(const ServiceConfig& config)
    : repository_(prepared_db_path(config)),
      blobs_(config.resolved_originals_dir(), config.resolved_thumbs_dir()) {
  if (auto dirs = blobs_.ensure_dirs(); !dirs) throw std::runtime_error(dirs.error().message);
  if (auto schema = repository_.initialize_schema(); !schema) {
    throw std::runtime_error(schema.error().message);
  }

  pv::CaptionOptions caption_options;
  caption_options.prompt = config.caption_prompt;
  captioner_ = std::make_shared<pv::Captioner>(make_caption_backend(config), caption_options);
  pipeline_ = build_pipeline(captioner_);
  coordinator_ = std::make_unique<PipelineCoordinator>(repository_, blobs_, *pipeline_);

  PipelineCoordinator* coordinator = coordinator_.get();
  dispatcher_ = make_dispatcher(config, [coordinator](const std::string& id) {
    (void)coordinator->run(id);
  });
  ingest_ = std::make_unique<IngestService>(repository_, blobs_, *dispatcher_);
  query_ = std::make_unique<QueryService>(repository_, blobs_);
}

PictorService::~PictorService() {
  if (dispatcher_) dispatcher_->shutdown();
}

}  // namespace pictor::app

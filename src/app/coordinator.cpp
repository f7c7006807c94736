#include <pictor/app/coordinator.hpp>
#include <pictor/core/timestamp.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <utility>
#include <variant>

namespace pictor::app {

namespace pc = pictor::core;

namespace {

constexpr const char* kThumbnailExtension = ".jpg";

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

}  // namespace

PipelineCoordinator::PipelineCoordinator(storage::IItemRepository& repository,
                                         storage::IBlobStore& blobs,
                                         const pc::Pipeline& pipeline)
    : repository_(repository), blobs_(blobs), pipeline_(pipeline) {}

std::optional<pc::ItemStatus> PipelineCoordinator::run(const std::string& item_id) {
  const auto start = std::chrono::steady_clock::now();

  auto found = repository_.find(item_id);
  if (!found) {
    spdlog::error("job {}: cannot load item, left in processing: {}", item_id,
                  found.error().message);
    return std::nullopt;
  }
  if (!found->has_value()) {
    spdlog::warn("job {}: no such item, skipping", item_id);
    return std::nullopt;
  }
  const pc::Item& item = **found;
  if (pc::is_terminal(item.status)) {
    spdlog::warn("job {}: item is already {}, skipping", item_id, pc::to_string(item.status));
    return std::nullopt;
  }
  spdlog::info("job {}: processing '{}'", item_id, item.original_name);

  pc::ThumbnailRefs written;
  pc::TerminalUpdate update;
  try {
    auto derived = derive(item, written);
    if (derived) {
      update.outcome = std::move(*derived);
    } else {
      update.outcome = pc::FailureOutcome{std::move(derived.error().message)};
    }
  } catch (const std::exception& e) {
    update.outcome = pc::FailureOutcome{e.what()};
  } catch (...) {
    update.outcome = pc::FailureOutcome{"unknown error during processing"};
  }

  if (std::holds_alternative<pc::FailureOutcome>(update.outcome)) {
    discard(written);
  }
  const std::int64_t ms = elapsed_ms(start);
  update.processing_ms = ms;
  update.completed_at = pc::utc_now_iso();

  if (auto written_ok = repository_.complete(item_id, update); !written_ok) {
    spdlog::error("job {}: terminal write failed, item left in processing: {}", item_id,
                  written_ok.error().message);
    if (update.status() == pc::ItemStatus::Succeeded) discard(written);
    return std::nullopt;
  }

  if (const auto* failed = std::get_if<pc::FailureOutcome>(&update.outcome)) {
    spdlog::warn("job {}: failed after {} ms: {}", item_id, ms, failed->error);
  } else {
    spdlog::info("job {}: processed in {} ms", item_id, ms);
  }
  return update.status();
}

std::expected<pc::SuccessOutcome, pc::Error> PipelineCoordinator::derive(
    const pc::Item& item, pc::ThumbnailRefs& written) {
  auto original = blobs_.read(item.stored_ref);
  if (!original) {
    return std::unexpected(pc::make_error(pc::ErrorCode::StageFailure,
                                          "original: " + original.error().message));
  }
  const std::uint64_t size_bytes = item.size_bytes > 0
                                       ? static_cast<std::uint64_t>(item.size_bytes)
                                       : static_cast<std::uint64_t>(original->size());

  const pc::StageTimingCallback timing = [&item](std::string_view stage, double ms) {
    spdlog::debug("job {}: stage {} took {:.1f} ms", item.id, stage, ms);
  };
  auto derivation = pipeline_.run(*original, size_bytes, &timing);
  if (!derivation) return std::unexpected(std::move(derivation.error()));
  if (!derivation->complete()) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::StageFailure, "pipeline finished with missing outputs"));
  }

  const std::pair<pc::ThumbnailVariant, const pc::Bytes*> variants[] = {
      {pc::ThumbnailVariant::Small, &derivation->thumbnails->small},
      {pc::ThumbnailVariant::Medium, &derivation->thumbnails->medium},
  };
  for (const auto& [variant, bytes] : variants) {
    const storage::BlobKey key{item.id, std::string(pc::to_string(variant)), kThumbnailExtension};
    auto ref = blobs_.put(key, *bytes);
    if (!ref) {
      return std::unexpected(pc::make_error(
          pc::ErrorCode::StageFailure,
          "thumbnails: cannot store " + key.variant + ": " + ref.error().message));
    }
    written[variant] = std::move(*ref);
  }

  const pc::ImageMetadata& meta = *derivation->metadata;
  return pc::SuccessOutcome{meta.width, meta.height, meta.format,
                            std::move(*derivation->caption), written};
}

void PipelineCoordinator::discard(const pc::ThumbnailRefs& written) {
  for (const auto& [variant, ref] : written) {
    if (auto removed = blobs_.remove(ref); !removed) {
      spdlog::warn("cannot remove {} thumbnail {}: {}", pc::to_string(variant), ref,
                   removed.error().message);
    }
  }
}

}  // namespace pictor::app

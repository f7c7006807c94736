#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/item.hpp>
#include <pictor/core/pipeline.hpp>
#include <pictor/storage/blob_store.hpp>
#include <pictor/storage/item_repository.hpp>
#include <expected>
#include <optional>
#include <string>

namespace pictor::app {

/// Drives one item from Processing to exactly one terminal state.
///
/// run() loads the item, derives everything from the stored original, persists the
/// thumbnails and writes a single TerminalUpdate. Any stage error or exception becomes
/// a Failed update; thumbnails already stored by the run are removed first. If the
/// terminal write itself fails the item stays Processing and the fault is logged.
///
/// Thread-safety: run() may be called concurrently for different items.
class PipelineCoordinator {
 public:
  PipelineCoordinator(storage::IItemRepository& repository,
                      storage::IBlobStore& blobs,
                      const pictor::core::Pipeline& pipeline);

  /// Status written, or nullopt when nothing was written (unknown item, already
  /// terminal, or the terminal write failed).
  std::optional<pictor::core::ItemStatus> run(const std::string& item_id);

 private:
  [[nodiscard]] std::expected<pictor::core::SuccessOutcome, pictor::core::Error>
  derive(const pictor::core::Item& item, pictor::core::ThumbnailRefs& written);

  void discard(const pictor::core::ThumbnailRefs& written);

  storage::IItemRepository& repository_;
  storage::IBlobStore& blobs_;
  const pictor::core::Pipeline& pipeline_;
};

}  // namespace pictor::app

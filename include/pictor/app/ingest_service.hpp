#pragma once

#include <pictor/app/job_dispatcher.hpp>
#include <pictor/core/error.hpp>
#include <pictor/core/item.hpp>
#include <pictor/storage/blob_store.hpp>
#include <pictor/storage/item_repository.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace pictor::app {

/// One upload as handed over by the transport.
struct UploadRequest {
  std::string original_name;
  std::string content_type;
  std::span<const std::byte> payload;
};

/// Tracking handle returned to the uploader.
struct AcceptedUpload {
  std::string id;
  pictor::core::ItemStatus status{pictor::core::ItemStatus::Processing};
};

/// ".jpg" for image/jpeg, ".png" for image/png, empty for anything else.
/// Case-insensitive; media-type parameters are ignored.
[[nodiscard]] std::string extension_for_content_type(std::string_view content_type);

/// Random RFC 4122 version 4 id.
[[nodiscard]] std::string generate_item_id();

using IdGenerator = std::function<std::string()>;

/// Acceptance path: validate, store the original, insert the Processing row, submit the job.
/// Nothing is written for a rejected upload.
class IngestService {
 public:
  IngestService(storage::IItemRepository& repository,
                storage::IBlobStore& blobs,
                IJobDispatcher& dispatcher,
                IdGenerator next_id = generate_item_id);

  [[nodiscard]] std::expected<AcceptedUpload, pictor::core::Error>
  accept(const UploadRequest& upload);

 private:
  storage::IItemRepository& repository_;
  storage::IBlobStore& blobs_;
  IJobDispatcher& dispatcher_;
  IdGenerator next_id_;
};

}  // namespace pictor::app

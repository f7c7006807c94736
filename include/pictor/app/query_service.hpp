#pragma once

#include <pictor/core/derivation.hpp>
#include <pictor/core/error.hpp>
#include <pictor/core/item.hpp>
#include <pictor/storage/blob_store.hpp>
#include <pictor/storage/item_repository.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pictor::app {

/// Client-facing metadata; only exists for Succeeded items.
struct MetadataView {
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::string format;  // "jpg", "png"
  std::int64_t size_bytes{0};
  std::string caption;
};

/// Projection of one item. metadata and thumbnails are filled only when status is Succeeded.
struct ItemView {
  std::string image_id;
  pictor::core::ItemStatus status{pictor::core::ItemStatus::Processing};
  std::string original_name;
  std::optional<std::string> processed_at;
  std::optional<MetadataView> metadata;
  std::map<std::string, std::string> thumbnails;  // variant -> URL
  std::optional<std::string> error;
};

struct StatsView {
  std::int64_t total{0};
  std::int64_t failed{0};
  std::string success_rate{"0.00%"};
  double average_processing_time_seconds{0.0};
};

struct ThumbnailBlob {
  pictor::core::Bytes bytes;
  std::string content_type{"image/jpeg"};
};

/// Map an item to its view. Thumbnail URLs are "<base_url>/api/images/<id>/thumbnails/<variant>".
[[nodiscard]] ItemView project(const pictor::core::Item& item, std::string_view base_url);

/// 100 * succeeded / total with two decimals and a '%' suffix; "0.00%" when total is 0.
[[nodiscard]] std::string format_success_rate(std::int64_t succeeded, std::int64_t total);

/// Read-only queries over the repository and blob store.
class QueryService {
 public:
  QueryService(const storage::IItemRepository& repository, const storage::IBlobStore& blobs);

  /// Newest first.
  [[nodiscard]] std::expected<std::vector<ItemView>, pictor::core::Error>
  list(std::string_view base_url) const;

  /// NotFound if the id is unknown.
  [[nodiscard]] std::expected<ItemView, pictor::core::Error>
  get(const std::string& id, std::string_view base_url) const;

  /// NotFound for an unknown item, Conflict unless Succeeded, Validation for an
  /// unknown variant, NotFound when the blob is missing.
  [[nodiscard]] std::expected<ThumbnailBlob, pictor::core::Error>
  thumbnail(const std::string& id, std::string_view variant) const;

  [[nodiscard]] std::expected<StatsView, pictor::core::Error> stats() const;

 private:
  const storage::IItemRepository& repository_;
  const storage::IBlobStore& blobs_;
};

}  // namespace pictor::app

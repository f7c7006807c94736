#include <pictor/core/item.hpp>

namespace pictor::core {

std::string_view to_string(ItemStatus status) noexcept {
  switch (status) {
    case ItemStatus::Processing:
      return "processing";
    case ItemStatus::Succeeded:
      return "success";
    case ItemStatus::Failed:
      return "failed";
  }
  return "processing";
}

std::optional<ItemStatus> parse_item_status(std::string_view token) noexcept {
  if (token == "processing") return ItemStatus::Processing;
  if (token == "success") return ItemStatus::Succeeded;
  if (token == "failed") return ItemStatus::Failed;
  return std::nullopt;
}

std::string_view to_string(ThumbnailVariant variant) noexcept {
  switch (variant) {
    case ThumbnailVariant::Small:
      return "small";
    case ThumbnailVariant::Medium:
      return "medium";
  }
  return "small";
}

std::optional<ThumbnailVariant> parse_thumbnail_variant(std::string_view token) noexcept {
  if (token == "small") return ThumbnailVariant::Small;
  if (token == "medium") return ThumbnailVariant::Medium;
  return std::nullopt;
}

namespace {

bool has_success_field(const Item& item) noexcept {
  return item.width || item.height || item.format || item.caption ||
         !item.thumbnail_refs.empty();
}

bool has_all_success_fields(const Item& item) noexcept {
  return item.width && item.height && item.format && item.caption &&
         item.thumbnail_refs.contains(ThumbnailVariant::Small) &&
         item.thumbnail_refs.contains(ThumbnailVariant::Medium);
}

}  // namespace

bool lifecycle_consistent(const Item& item) noexcept {
  switch (item.status) {
    case ItemStatus::Processing:
      return !item.completed_at && !item.processing_ms && !item.error &&
             !has_success_field(item);
    case ItemStatus::Succeeded:
      return has_all_success_fields(item) && !item.error && item.completed_at.has_value();
    case ItemStatus::Failed:
      return item.error && !item.error->empty() && !has_success_field(item) &&
             item.completed_at.has_value();
  }
  return false;
}

}  // namespace pictor::core

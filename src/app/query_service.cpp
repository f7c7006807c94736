#include <pictor/app/query_service.hpp>
#include <pictor/vision/metadata_stage.hpp>
#include <cstdio>
#include <utility>

namespace pictor::app {

namespace pc = pictor::core;

ItemView project(const pc::Item& item, std::string_view base_url) {
  ItemView view;
  view.image_id = item.id;
  view.status = item.status;
  view.original_name = item.original_name;
  view.processed_at = item.completed_at;

  if (item.status == pc::ItemStatus::Succeeded) {
    MetadataView meta;
    meta.width = item.width.value_or(0);
    meta.height = item.height.value_or(0);
    meta.format = pictor::vision::client_format_token(item.format.value_or(""));
    meta.size_bytes = item.size_bytes;
    meta.caption = item.caption.value_or("");
    view.metadata = std::move(meta);

    for (const auto& [variant, ref] : item.thumbnail_refs) {
      const std::string name(pc::to_string(variant));
      view.thumbnails[name] =
          std::string(base_url) + "/api/images/" + item.id + "/thumbnails/" + name;
    }
  } else if (item.status == pc::ItemStatus::Failed) {
    view.error = item.error;
  }
  return view;
}

std::string format_success_rate(std::int64_t succeeded, std::int64_t total) {
  const double rate =
      total > 0 ? 100.0 * static_cast<double>(succeeded) / static_cast<double>(total) : 0.0;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f%%", rate);
  return buf;
}

QueryService::QueryService(const storage::IItemRepository& repository,
                           const storage::IBlobStore& blobs)
    : repository_(repository), blobs_(blobs) {}

std::expected<std::vector<ItemView>, pc::Error> QueryService::list(std::string_view base_url) const {
  auto items = repository_.list_newest_first();
  if (!items) return std::unexpected(std::move(items.error()));
  std::vector<ItemView> views;
  views.reserve(items->size());
  for (const auto& item : *items) views.push_back(project(item, base_url));
  return views;
}

std::expected<ItemView, pc::Error> QueryService::get(const std::string& id,
                                                    std::string_view base_url) const {
  auto found = repository_.find(id);
  if (!found) return std::unexpected(std::move(found.error()));
  if (!found->has_value()) {
    return std::unexpected(pc::make_error(pc::ErrorCode::NotFound, "Image not found."));
  }
  return project(**found, base_url);
}

std::expected<ThumbnailBlob, pc::Error> QueryService::thumbnail(const std::string& id,
                                                               std::string_view variant) const {
  auto found = repository_.find(id);
  if (!found) return std::unexpected(std::move(found.error()));
  if (!found->has_value()) {
    return std::unexpected(pc::make_error(pc::ErrorCode::NotFound, "Image not found."));
  }
  const pc::Item& item = **found;
  if (item.status != pc::ItemStatus::Succeeded) {
    return std::unexpected(pc::make_error(pc::ErrorCode::Conflict,
                                          "Thumbnails not ready (processing not successful)."));
  }
  const auto parsed = pc::parse_thumbnail_variant(variant);
  if (!parsed) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::Validation, "size must be 'small' or 'medium'."));
  }
  const auto ref = item.thumbnail_refs.find(*parsed);
  if (ref == item.thumbnail_refs.end()) {
    return std::unexpected(pc::make_error(pc::ErrorCode::NotFound, "Thumbnail not found."));
  }
  auto bytes = blobs_.read(ref->second);
  if (!bytes) {
    if (bytes.error().code == pc::ErrorCode::NotFound) {
      return std::unexpected(pc::make_error(pc::ErrorCode::NotFound, "Thumbnail not found."));
    }
    return std::unexpected(std::move(bytes.error()));
  }
  return ThumbnailBlob{std::move(*bytes), "image/jpeg"};
}

std::expected<StatsView, pc::Error> QueryService::stats() const {
  auto counts = repository_.counts();
  if (!counts) return std::unexpected(std::move(counts.error()));
  StatsView view;
  view.total = counts->total;
  view.failed = counts->failed;
  view.success_rate = format_success_rate(counts->succeeded, counts->total);
  view.average_processing_time_seconds = counts->average_processing_ms.value_or(0.0) / 1000.0;
  return view;
}

}  // namespace pictor::app

#include <pictor/app/json_views.hpp>
#include <string>

namespace pictor::app {

using nlohmann::json;
namespace pc = pictor::core;

json to_json(const ItemView& view) {
  json metadata = json::object();
  if (view.metadata) {
    metadata = {
        {"width", view.metadata->width},
        {"height", view.metadata->height},
        {"format", view.metadata->format},
        {"size_bytes", view.metadata->size_bytes},
        {"caption", view.metadata->caption},
    };
  }
  json thumbnails = json::object();
  for (const auto& [variant, url] : view.thumbnails) thumbnails[variant] = url;

  json data = {
      {"image_id", view.image_id},
      {"original_name", view.original_name},
      {"processed_at", view.processed_at ? json(*view.processed_at) : json(nullptr)},
      {"metadata", std::move(metadata)},
      {"thumbnails", std::move(thumbnails)},
  };
  return json{
      {"status", std::string(pc::to_string(view.status))},
      {"data", std::move(data)},
      {"error", view.error ? json(*view.error) : json(nullptr)},
  };
}

json to_json(const std::vector<ItemView>& views) {
  json out = json::array();
  for (const auto& view : views) out.push_back(to_json(view));
  return out;
}

json to_json(const StatsView& stats) {
  return json{
      {"total", stats.total},
      {"failed", stats.failed},
      {"success_rate", stats.success_rate},
      {"average_processing_time_seconds", stats.average_processing_time_seconds},
  };
}

json to_json(const AcceptedUpload& accepted) {
  return json{{"image_id", accepted.id}, {"status", std::string(pc::to_string(accepted.status))}};
}

json error_body(const pc::Error& error) {
  return json{{"detail", error.message}};
}

int http_status_for(pc::ErrorCode code) noexcept {
  switch (code) {
    case pc::ErrorCode::Validation:
      return 400;
    case pc::ErrorCode::NotFound:
      return 404;
    case pc::ErrorCode::Conflict:
      return 409;
    case pc::ErrorCode::Unavailable:
      return 503;
    default:
      return 500;
  }
}

}  // namespace pictor::app

#pragma once

#include <pictor/app/ingest_service.hpp>
#include <pictor/app/query_service.hpp>
#include <pictor/core/error.hpp>
#include <nlohmann/json.hpp>
#include <vector>

namespace pictor::app {

/// {"status", "data": {"image_id", "original_name", "processed_at", "metadata", "thumbnails"}, "error"}.
/// metadata and thumbnails are empty objects unless the item succeeded.
[[nodiscard]] nlohmann::json to_json(const ItemView& view);
[[nodiscard]] nlohmann::json to_json(const std::vector<ItemView>& views);

/// {"total", "failed", "success_rate", "average_processing_time_seconds"}.
[[nodiscard]] nlohmann::json to_json(const StatsView& stats);

/// {"image_id", "status"}.
[[nodiscard]] nlohmann::json to_json(const AcceptedUpload& accepted);

/// {"detail": message}.
[[nodiscard]] nlohmann::json error_body(const pictor::core::Error& error);

/// HTTP status for an error code: 400, 404, 409, 503 or 500.
[[nodiscard]] int http_status_for(pictor::core::ErrorCode code) noexcept;

}  // namespace pictor::app

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace pictor::core {

/// Persisted lifecycle status. Transitions are Processing -> Succeeded | Failed only.
enum class ItemStatus : std::uint8_t {
  Processing,
  Succeeded,
  Failed,
};

/// Named thumbnail size.
enum class ThumbnailVariant : std::uint8_t {
  Small,
  Medium,
};

/// Persisted / wire token: "processing", "success", "failed".
[[nodiscard]] std::string_view to_string(ItemStatus status) noexcept;
[[nodiscard]] std::optional<ItemStatus> parse_item_status(std::string_view token) noexcept;

/// "small" / "medium".
[[nodiscard]] std::string_view to_string(ThumbnailVariant variant) noexcept;
[[nodiscard]] std::optional<ThumbnailVariant> parse_thumbnail_variant(std::string_view token) noexcept;

[[nodiscard]] inline bool is_terminal(ItemStatus status) noexcept {
  return status != ItemStatus::Processing;
}

using ThumbnailRefs = std::map<ThumbnailVariant, std::string>;

/// One uploaded image and its processing lifecycle.
/// Optional fields are present exactly as lifecycle_consistent() describes.
struct Item {
  std::string id;
  std::string original_name;
  std::string mime_type;
  std::int64_t size_bytes{0};
  std::string stored_ref;
  ItemStatus status{ItemStatus::Processing};

  std::optional<std::uint32_t> width;
  std::optional<std::uint32_t> height;
  std::optional<std::string> format;  // encoder name, e.g. "JPEG"
  std::optional<std::string> caption;
  std::optional<std::string> error;
  ThumbnailRefs thumbnail_refs;

  std::string created_at;                   // ISO-8601 UTC
  std::optional<std::string> completed_at;  // ISO-8601 UTC
  std::optional<std::int64_t> processing_ms;
};

/// Fields written when every stage succeeded.
struct SuccessOutcome {
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::string format;
  std::string caption;
  ThumbnailRefs thumbnail_refs;
};

struct FailureOutcome {
  std::string error;
};

/// The single write that moves an item out of Processing.
struct TerminalUpdate {
  std::variant<SuccessOutcome, FailureOutcome> outcome;
  std::string completed_at;
  std::optional<std::int64_t> processing_ms;  // absent when no job ran

  [[nodiscard]] ItemStatus status() const noexcept {
    return std::holds_alternative<SuccessOutcome>(outcome) ? ItemStatus::Succeeded
                                                           : ItemStatus::Failed;
  }
};

/// True if field presence matches status:
/// Succeeded <=> width, height, format, caption and both thumbnail refs present, no error;
/// Failed <=> non-empty error and no success field; Processing <=> nothing terminal set.
[[nodiscard]] bool lifecycle_consistent(const Item& item) noexcept;

}  // namespace pictor::core

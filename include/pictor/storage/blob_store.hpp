#pragma once

#include <pictor/core/derivation.hpp>
#include <pictor/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace pictor::storage {

inline constexpr std::string_view kOriginalVariant = "original";

/// Address of one blob: the item it belongs to and its purpose.
/// variant is "original" for the upload, or a thumbnail variant name.
/// extension includes the dot (".jpg", ".png").
struct BlobKey {
  std::string item_id;
  std::string variant;
  std::string extension;
};

/// Durable byte storage addressed by BlobKey. Returned references are opaque strings
/// stored in the item record. Implementations must be safe for concurrent use.
class IBlobStore {
 public:
  virtual ~IBlobStore() = default;

  /// Store bytes; the blob is complete when this returns (no torn reads). Returns its reference.
  [[nodiscard]] virtual std::expected<std::string, pictor::core::Error>
  put(const BlobKey& key, std::span<const std::byte> bytes) = 0;

  /// NotFound if the reference does not resolve, BlobStore on I/O failure.
  [[nodiscard]] virtual std::expected<pictor::core::Bytes, pictor::core::Error>
  read(const std::string& ref) const = 0;

  [[nodiscard]] virtual std::expected<std::uint64_t, pictor::core::Error>
  size(const std::string& ref) const = 0;

  [[nodiscard]] virtual bool exists(const std::string& ref) const = 0;

  /// Removing a missing blob succeeds.
  [[nodiscard]] virtual std::expected<void, pictor::core::Error>
  remove(const std::string& ref) = 0;
};

}  // namespace pictor::storage

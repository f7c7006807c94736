#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/item.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace pictor::storage {

/// Aggregate counts taken from one consistent snapshot.
struct ItemCounts {
  std::int64_t total{0};
  std::int64_t succeeded{0};
  std::int64_t failed{0};
  std::optional<double> average_processing_ms;  // over items with a recorded duration
};

/// Durable item lifecycle store.
///
/// Contract:
/// - insert() creates a Processing row; a duplicate id fails with Conflict.
/// - complete() is the only mutation after insert. It applies a TerminalUpdate in a
///   single atomic statement and only while the row is still Processing: NotFound for
///   an unknown id, Conflict if the item is already terminal.
/// - Reads never observe a partially applied terminal update.
/// Implementations must be safe for concurrent use.
class IItemRepository {
 public:
  virtual ~IItemRepository() = default;

  [[nodiscard]] virtual std::expected<void, pictor::core::Error>
  insert(const pictor::core::Item& item) = 0;

  [[nodiscard]] virtual std::expected<void, pictor::core::Error>
  complete(const std::string& id, const pictor::core::TerminalUpdate& update) = 0;

  /// nullopt if no such item.
  [[nodiscard]] virtual std::expected<std::optional<pictor::core::Item>, pictor::core::Error>
  find(const std::string& id) const = 0;

  /// All items, newest first (creation time, then insertion order).
  [[nodiscard]] virtual std::expected<std::vector<pictor::core::Item>, pictor::core::Error>
  list_newest_first() const = 0;

  [[nodiscard]] virtual std::expected<ItemCounts, pictor::core::Error> counts() const = 0;
};

}  // namespace pictor::storage

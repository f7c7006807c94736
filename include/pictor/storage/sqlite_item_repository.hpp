#pragma once

#include <pictor/storage/item_repository.hpp>
#include <string>

struct sqlite3;

namespace pictor::storage {

/// SQLite-backed item repository (table "images").
/// One connection opened with SQLITE_OPEN_FULLMUTEX, WAL journal, 5 s busy timeout.
class SqliteItemRepository : public IItemRepository {
 public:
  /// Opens (creating if needed) the database file. Throws std::runtime_error on failure.
  explicit SqliteItemRepository(const std::string& db_path);
  ~SqliteItemRepository() override;

  SqliteItemRepository(const SqliteItemRepository&) = delete;
  SqliteItemRepository& operator=(const SqliteItemRepository&) = delete;

  /// Create the table and indexes if missing and add columns introduced later.
  /// Idempotent.
  [[nodiscard]] std::expected<void, pictor::core::Error> initialize_schema();

  [[nodiscard]] std::expected<void, pictor::core::Error>
  insert(const pictor::core::Item& item) override;

  [[nodiscard]] std::expected<void, pictor::core::Error>
  complete(const std::string& id, const pictor::core::TerminalUpdate& update) override;

  [[nodiscard]] std::expected<std::optional<pictor::core::Item>, pictor::core::Error>
  find(const std::string& id) const override;

  [[nodiscard]] std::expected<std::vector<pictor::core::Item>, pictor::core::Error>
  list_newest_first() const override;

  [[nodiscard]] std::expected<ItemCounts, pictor::core::Error> counts() const override;

 private:
  [[nodiscard]] std::expected<void, pictor::core::Error>
  ensure_column(const std::string& column, const std::string& type);

  sqlite3* db_{nullptr};
};

}  // namespace pictor::storage

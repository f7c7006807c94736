#include <pictor/storage/sqlite_item_repository.hpp>
#include "sqlite_statement.hpp"
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <stdexcept>
#include <utility>
#include <variant>

namespace pictor::storage {

namespace pc = pictor::core;
using detail::Statement;

namespace {

constexpr const char* kSchema = R"SQL(
  CREATE TABLE IF NOT EXISTS images (
    id                TEXT PRIMARY KEY,
    original_filename TEXT,
    stored_filename   TEXT,
    mime_type         TEXT,
    size_bytes        INTEGER,

    width             INTEGER,
    height            INTEGER,
    format            TEXT,

    created_at        TEXT,
    status            TEXT,
    caption           TEXT,
    error             TEXT,
    processing_ms     INTEGER,

    thumb_small_path  TEXT,
    thumb_medium_path TEXT,
    processed_at      TEXT
  );
  CREATE INDEX IF NOT EXISTS idx_images_created_at ON images(created_at);
  CREATE INDEX IF NOT EXISTS idx_images_status ON images(status);
)SQL";

constexpr const char* kSelectColumns = R"SQL(
  SELECT id, original_filename, stored_filename, mime_type, size_bytes,
         width, height, format, created_at, status, caption, error,
         processing_ms, thumb_small_path, thumb_medium_path, processed_at
  FROM images
)SQL";

std::expected<void, pc::Error> exec_all(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    return std::unexpected(pc::make_error(pc::ErrorCode::Repository, "SQLite exec failed: " + msg));
  }
  return {};
}

std::expected<pc::Item, pc::Error> row_to_item(const Statement& st) {
  pc::Item item;
  item.id = st.text(0);
  item.original_name = st.text(1);
  item.stored_ref = st.text(2);
  item.mime_type = st.text(3);
  item.size_bytes = st.int64(4);
  if (auto w = st.opt_int64(5)) item.width = static_cast<std::uint32_t>(*w);
  if (auto h = st.opt_int64(6)) item.height = static_cast<std::uint32_t>(*h);
  item.format = st.opt_text(7);
  item.created_at = st.text(8);

  const std::string status = st.text(9);
  const auto parsed = pc::parse_item_status(status);
  if (!parsed) {
    return std::unexpected(pc::make_error(
        pc::ErrorCode::Repository, "item " + item.id + " has unknown status '" + status + "'"));
  }
  item.status = *parsed;
  item.caption = st.opt_text(10);
  item.error = st.opt_text(11);
  item.processing_ms = st.opt_int64(12);
  if (auto small = st.opt_text(13)) item.thumbnail_refs[pc::ThumbnailVariant::Small] = *small;
  if (auto medium = st.opt_text(14)) item.thumbnail_refs[pc::ThumbnailVariant::Medium] = *medium;
  item.completed_at = st.opt_text(15);
  return item;
}

}  // namespace

SqliteItemRepository::SqliteItemRepository(const std::string& db_path) {
  const int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to open DB " + db_path + ": " + msg);
  }
  sqlite3_busy_timeout(db_, 5000);
}

SqliteItemRepository::~SqliteItemRepository() {
  if (db_) sqlite3_close(db_);
}

std::expected<void, pc::Error> SqliteItemRepository::initialize_schema() {
  // journal_mode returns a row; sqlite3_exec discards it.
  if (auto r = exec_all(db_, "PRAGMA journal_mode=WAL;"); !r) return r;
  if (auto r = exec_all(db_, "PRAGMA synchronous=NORMAL;"); !r) return r;
  if (auto r = exec_all(db_, kSchema); !r) return r;
  // Databases created before processed_at was tracked.
  return ensure_column("processed_at", "TEXT");
}

std::expected<void, pc::Error> SqliteItemRepository::ensure_column(const std::string& column,
                                                                   const std::string& type) {
  Statement st(db_, "PRAGMA table_info(images)");
  if (!st.ok()) return std::unexpected(st.error("table_info failed"));
  int rc;
  while ((rc = st.step()) == SQLITE_ROW) {
    if (st.text(1) == column) return {};
  }
  if (rc != SQLITE_DONE) return std::unexpected(st.error("table_info failed"));

  spdlog::info("adding column images.{}", column);
  const std::string sql = "ALTER TABLE images ADD COLUMN " + column + " " + type;
  return exec_all(db_, sql.c_str());
}

std::expected<void, pc::Error> SqliteItemRepository::insert(const pc::Item& item) {
  if (item.status != pc::ItemStatus::Processing) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::Conflict, "new items must start in processing"));
  }
  Statement st(db_, R"SQL(
    INSERT INTO images (
      id, original_filename, stored_filename, mime_type, size_bytes,
      created_at, status
    ) VALUES (?, ?, ?, ?, ?, ?, ?)
  )SQL");
  if (!st.ok()) return std::unexpected(st.error("insert prepare failed"));
  int i = 1;
  st.bind(i++, item.id);
  st.bind(i++, item.original_name);
  st.bind(i++, item.stored_ref);
  st.bind(i++, item.mime_type);
  st.bind(i++, item.size_bytes);
  st.bind(i++, item.created_at);
  st.bind(i++, std::string(pc::to_string(pc::ItemStatus::Processing)));

  const int rc = st.step();
  if (rc == SQLITE_CONSTRAINT) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::Conflict, "duplicate item id " + item.id));
  }
  if (rc != SQLITE_DONE) return std::unexpected(st.error("insert failed"));
  return {};
}

std::expected<void, pc::Error> SqliteItemRepository::complete(const std::string& id,
                                                              const pc::TerminalUpdate& update) {
  Statement st(db_, R"SQL(
    UPDATE images
    SET status=?, width=?, height=?, format=?,
        caption=?, processing_ms=?,
        thumb_small_path=?, thumb_medium_path=?,
        error=?, processed_at=?
    WHERE id=? AND status='processing'
    RETURNING id
  )SQL");
  if (!st.ok()) return std::unexpected(st.error("update prepare failed"));

  int i = 1;
  st.bind(i++, std::string(pc::to_string(update.status())));
  if (const auto* ok = std::get_if<pc::SuccessOutcome>(&update.outcome)) {
    const auto small = ok->thumbnail_refs.find(pc::ThumbnailVariant::Small);
    const auto medium = ok->thumbnail_refs.find(pc::ThumbnailVariant::Medium);
    if (small == ok->thumbnail_refs.end() || medium == ok->thumbnail_refs.end()) {
      return std::unexpected(pc::make_error(pc::ErrorCode::Conflict,
                                            "success update needs both thumbnail refs"));
    }
    st.bind(i++, static_cast<std::int64_t>(ok->width));
    st.bind(i++, static_cast<std::int64_t>(ok->height));
    st.bind(i++, ok->format);
    st.bind(i++, ok->caption);
    st.bind(i++, update.processing_ms);
    st.bind(i++, small->second);
    st.bind(i++, medium->second);
    st.bind_null(i++);
  } else {
    const auto& failed = std::get<pc::FailureOutcome>(update.outcome);
    st.bind_null(i++);
    st.bind_null(i++);
    st.bind_null(i++);
    st.bind_null(i++);
    st.bind(i++, update.processing_ms);
    st.bind_null(i++);
    st.bind_null(i++);
    st.bind(i++, failed.error.empty() ? std::string("unknown error") : failed.error);
  }
  st.bind(i++, update.completed_at);
  st.bind(i++, id);

  const int rc = st.step();
  if (rc == SQLITE_ROW) return {};
  if (rc != SQLITE_DONE) return std::unexpected(st.error("terminal update failed"));

  auto existing = find(id);
  if (!existing) return std::unexpected(std::move(existing.error()));
  if (!*existing) {
    return std::unexpected(pc::make_error(pc::ErrorCode::NotFound, "item not found: " + id));
  }
  return std::unexpected(pc::make_error(pc::ErrorCode::Conflict,
                                        "item " + id + " is already " +
                                            std::string(pc::to_string((*existing)->status))));
}

std::expected<std::optional<pc::Item>, pc::Error> SqliteItemRepository::find(
    const std::string& id) const {
  const std::string sql = std::string(kSelectColumns) + " WHERE id=?";
  Statement st(db_, sql.c_str());
  if (!st.ok()) return std::unexpected(st.error("select prepare failed"));
  st.bind(1, id);

  const int rc = st.step();
  if (rc == SQLITE_DONE) return std::optional<pc::Item>{};
  if (rc != SQLITE_ROW) return std::unexpected(st.error("select failed"));
  auto item = row_to_item(st);
  if (!item) return std::unexpected(std::move(item.error()));
  return std::optional<pc::Item>(std::move(*item));
}

std::expected<std::vector<pc::Item>, pc::Error> SqliteItemRepository::list_newest_first() const {
  const std::string sql = std::string(kSelectColumns) + " ORDER BY created_at DESC, rowid DESC";
  Statement st(db_, sql.c_str());
  if (!st.ok()) return std::unexpected(st.error("list prepare failed"));

  std::vector<pc::Item> items;
  int rc;
  while ((rc = st.step()) == SQLITE_ROW) {
    auto item = row_to_item(st);
    if (!item) return std::unexpected(std::move(item.error()));
    items.push_back(std::move(*item));
  }
  if (rc != SQLITE_DONE) return std::unexpected(st.error("list failed"));
  return items;
}

std::expected<ItemCounts, pc::Error> SqliteItemRepository::counts() const {
  Statement st(db_, R"SQL(
    SELECT COUNT(*),
           COALESCE(SUM(CASE WHEN status='success' THEN 1 ELSE 0 END), 0),
           COALESCE(SUM(CASE WHEN status='failed' THEN 1 ELSE 0 END), 0),
           AVG(processing_ms)
    FROM images
  )SQL");
  if (!st.ok()) return std::unexpected(st.error("stats prepare failed"));
  if (st.step() != SQLITE_ROW) return std::unexpected(st.error("stats failed"));

  ItemCounts c;
  c.total = st.int64(0);
  c.succeeded = st.int64(1);
  c.failed = st.int64(2);
  if (!st.is_null(3)) c.average_processing_ms = st.real(3);
  return c;
}

}  // namespace pictor::storage

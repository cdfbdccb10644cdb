#include "flakeid/storage/sqlite/sqlite_watermark_store.h"

#include <sqlite3.h>

#include <string>
#include <utility>

namespace flakeid::storage::sqlite {

SqliteWatermarkStore::SqliteWatermarkStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<std::optional<std::int64_t>, std::string> SqliteWatermarkStore::load(
    const core::NodeIdentity& identity) const {
  using R = core::Result<std::optional<std::int64_t>, std::string>;

  const char* sql = R"(
    SELECT last_timestamp_ms FROM generator_watermarks
    WHERE datacenter_id = ? AND worker_id = ?
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return R::err("load watermark: failed to prepare: " + stmt.error());
  }

  sqlite3_bind_int(stmt.get(), 1, static_cast<int>(identity.datacenter_id()));
  sqlite3_bind_int(stmt.get(), 2, static_cast<int>(identity.worker_id()));

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return R::ok(static_cast<std::int64_t>(sqlite3_column_int64(stmt.get(), 0)));
  }
  if (rc == SQLITE_DONE) {
    return R::ok(std::nullopt);
  }

  return R::err("load watermark: " + std::string(sqlite3_errmsg(db_->connection())));
}

core::Result<bool, std::string> SqliteWatermarkStore::save(const core::NodeIdentity& identity,
                                                           std::int64_t last_timestamp_ms) {
  using R = core::Result<bool, std::string>;

  const char* sql = R"(
    INSERT INTO generator_watermarks
      (datacenter_id, worker_id, last_timestamp_ms, updated_at)
    VALUES (?, ?, ?, datetime('now'))
    ON CONFLICT(datacenter_id, worker_id) DO UPDATE SET
      last_timestamp_ms = MAX(last_timestamp_ms, excluded.last_timestamp_ms),
      updated_at        = excluded.updated_at
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return R::err("save watermark: failed to prepare: " + stmt.error());
  }

  sqlite3_bind_int(stmt.get(), 1, static_cast<int>(identity.datacenter_id()));
  sqlite3_bind_int(stmt.get(), 2, static_cast<int>(identity.worker_id()));
  sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(last_timestamp_ms));

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return R::err("save watermark: " + std::string(sqlite3_errmsg(db_->connection())));
  }

  return R::ok(true);
}

}  // namespace flakeid::storage::sqlite

#pragma once

#include "flakeid/storage/sqlite/sqlite_db.h"
#include "flakeid/storage/watermark_store.h"

#include <memory>

namespace flakeid::storage::sqlite {

// SqliteWatermarkStore persists watermarks to the generator_watermarks table (schema v1).
// The caller must have applied ensure_schema_v1() on db.
//
// save() upserts with MAX(existing, new) in a single statement, so concurrent writers
// on a shared file never move a watermark backwards.
class SqliteWatermarkStore final : public IWatermarkStore {
 public:
  explicit SqliteWatermarkStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<std::optional<std::int64_t>, std::string> load(
      const core::NodeIdentity& identity) const override;

  [[nodiscard]] core::Result<bool, std::string> save(const core::NodeIdentity& identity,
                                                     std::int64_t last_timestamp_ms) override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace flakeid::storage::sqlite

#include "flakeid/core/node_identity.h"
#include "flakeid/storage/sqlite/sqlite_db.h"
#include "flakeid/storage/sqlite/sqlite_watermark_store.h"

#include <catch2/catch_test_macros.hpp>

using namespace flakeid;
using namespace flakeid::storage::sqlite;

namespace {

std::shared_ptr<SqliteDb> make_db() {
  auto result = SqliteDb::open(":memory:");
  REQUIRE(result.has_value());
  auto db = result.value();
  auto schema = db->ensure_schema_v1();
  REQUIRE(schema.has_value());
  return db;
}

core::NodeIdentity identity(std::int64_t dc, std::int64_t worker) {
  auto result = core::make_node_identity(dc, worker);
  REQUIRE(result.has_value());
  return result.value();
}

}  // namespace

TEST_CASE("SqliteDb: schema v1 is applied once", "[sqlite][schema]") {
  auto result = SqliteDb::open(":memory:");
  REQUIRE(result.has_value());
  auto db = result.value();

  CHECK(db->get_schema_version() == 0);
  REQUIRE(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);

  // Idempotent.
  REQUIRE(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);
}

TEST_CASE("SqliteDb: exec reports SQL errors", "[sqlite]") {
  auto db = make_db();
  const auto bad = db->exec("SELECT * FROM no_such_table");
  CHECK_FALSE(bad.has_value());
  CHECK_FALSE(bad.error().empty());
}

TEST_CASE("PreparedStatement: invalid SQL reports the SQLite error", "[sqlite]") {
  auto db = make_db();

  PreparedStatement bad(db->connection(), "SELEC 1");
  CHECK_FALSE(bad.is_valid());
  CHECK(bad.get() == nullptr);
  CHECK_FALSE(bad.error().empty());

  PreparedStatement good(db->connection(), "SELECT 1");
  CHECK(good.is_valid());
  CHECK(good.error().empty());
}

TEST_CASE("SqliteWatermarkStore: repeated saves prepare a fresh statement each call",
          "[sqlite][watermark]") {
  SqliteWatermarkStore store(make_db());
  const auto node = identity(6, 9);

  for (std::int64_t ms = 1000; ms < 1100; ++ms) {
    REQUIRE(store.save(node, ms).has_value());
    const auto loaded = store.load(node);
    REQUIRE(loaded.has_value());
    CHECK(loaded.value() == std::optional<std::int64_t>{ms});
  }
}

TEST_CASE("SqliteWatermarkStore: unknown identity has no watermark", "[sqlite][watermark]") {
  SqliteWatermarkStore store(make_db());
  const auto loaded = store.load(identity(0, 0));
  REQUIRE(loaded.has_value());
  CHECK_FALSE(loaded.value().has_value());
}

TEST_CASE("SqliteWatermarkStore: save then load", "[sqlite][watermark]") {
  SqliteWatermarkStore store(make_db());
  REQUIRE(store.save(identity(3, 7), 1735689600005).has_value());

  const auto loaded = store.load(identity(3, 7));
  REQUIRE(loaded.has_value());
  CHECK(loaded.value() == std::optional<std::int64_t>{1735689600005});
}

TEST_CASE("SqliteWatermarkStore: upsert keeps the maximum", "[sqlite][watermark]") {
  SqliteWatermarkStore store(make_db());
  const auto node = identity(31, 31);

  REQUIRE(store.save(node, 5000).has_value());
  REQUIRE(store.save(node, 4000).has_value());
  CHECK(store.load(node).value() == std::optional<std::int64_t>{5000});

  REQUIRE(store.save(node, 6000).has_value());
  CHECK(store.load(node).value() == std::optional<std::int64_t>{6000});
}

TEST_CASE("SqliteWatermarkStore: identities are isolated", "[sqlite][watermark]") {
  SqliteWatermarkStore store(make_db());
  REQUIRE(store.save(identity(1, 2), 100).has_value());
  REQUIRE(store.save(identity(2, 1), 200).has_value());

  CHECK(store.load(identity(1, 2)).value() == std::optional<std::int64_t>{100});
  CHECK(store.load(identity(2, 1)).value() == std::optional<std::int64_t>{200});
  CHECK_FALSE(store.load(identity(1, 1)).value().has_value());
}

TEST_CASE("SqliteWatermarkStore: two stores on one connection see each other's writes",
          "[sqlite][watermark]") {
  auto db = make_db();
  SqliteWatermarkStore writer(db);
  SqliteWatermarkStore reader(db);

  REQUIRE(writer.save(identity(5, 5), 777).has_value());
  CHECK(reader.load(identity(5, 5)).value() == std::optional<std::int64_t>{777});
}

TEST_CASE("SqliteWatermarkStore: missing schema surfaces as an error", "[sqlite][watermark]") {
  auto result = SqliteDb::open(":memory:");
  REQUIRE(result.has_value());
  SqliteWatermarkStore store(result.value());

  CHECK_FALSE(store.load(identity(0, 0)).has_value());
  CHECK_FALSE(store.save(identity(0, 0), 1).has_value());
}

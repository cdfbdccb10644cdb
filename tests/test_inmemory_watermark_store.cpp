#include "flakeid/core/node_identity.h"
#include "flakeid/storage/inmemory_watermark_store.h"

#include <catch2/catch_test_macros.hpp>

using namespace flakeid;

namespace {

core::NodeIdentity identity(std::int64_t dc, std::int64_t worker) {
  auto result = core::make_node_identity(dc, worker);
  REQUIRE(result.has_value());
  return result.value();
}

}  // namespace

TEST_CASE("InMemoryWatermarkStore: unknown identity has no watermark", "[watermark][inmemory]") {
  storage::InMemoryWatermarkStore store;
  const auto loaded = store.load(identity(1, 2));
  REQUIRE(loaded.has_value());
  CHECK_FALSE(loaded.value().has_value());
}

TEST_CASE("InMemoryWatermarkStore: save then load", "[watermark][inmemory]") {
  storage::InMemoryWatermarkStore store;
  REQUIRE(store.save(identity(1, 2), 1000).has_value());

  const auto loaded = store.load(identity(1, 2));
  REQUIRE(loaded.has_value());
  CHECK(loaded.value() == std::optional<std::int64_t>{1000});
}

TEST_CASE("InMemoryWatermarkStore: watermark never moves backwards", "[watermark][inmemory]") {
  storage::InMemoryWatermarkStore store;
  const auto node = identity(4, 4);

  REQUIRE(store.save(node, 2000).has_value());
  REQUIRE(store.save(node, 1500).has_value());
  CHECK(store.load(node).value() == std::optional<std::int64_t>{2000});

  REQUIRE(store.save(node, 2500).has_value());
  CHECK(store.load(node).value() == std::optional<std::int64_t>{2500});
}

TEST_CASE("InMemoryWatermarkStore: identities are isolated", "[watermark][inmemory]") {
  storage::InMemoryWatermarkStore store;
  REQUIRE(store.save(identity(1, 2), 1000).has_value());
  REQUIRE(store.save(identity(2, 1), 3000).has_value());

  CHECK(store.load(identity(1, 2)).value() == std::optional<std::int64_t>{1000});
  CHECK(store.load(identity(2, 1)).value() == std::optional<std::int64_t>{3000});
  CHECK_FALSE(store.load(identity(1, 1)).value().has_value());
}

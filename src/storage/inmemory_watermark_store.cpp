#include "flakeid/storage/inmemory_watermark_store.h"

namespace flakeid::storage {

core::Result<std::optional<std::int64_t>, std::string> InMemoryWatermarkStore::load(
    const core::NodeIdentity& identity) const {
  using R = core::Result<std::optional<std::int64_t>, std::string>;

  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = watermarks_.find(Key{identity.datacenter_id(), identity.worker_id()});
  if (it == watermarks_.end()) {
    return R::ok(std::nullopt);
  }
  return R::ok(it->second);
}

core::Result<bool, std::string> InMemoryWatermarkStore::save(const core::NodeIdentity& identity,
                                                             std::int64_t last_timestamp_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  const Key key{identity.datacenter_id(), identity.worker_id()};

  auto [it, inserted] = watermarks_.try_emplace(key, last_timestamp_ms);
  if (!inserted && it->second < last_timestamp_ms) {
    it->second = last_timestamp_ms;
  }

  return core::Result<bool, std::string>::ok(true);
}

}  // namespace flakeid::storage

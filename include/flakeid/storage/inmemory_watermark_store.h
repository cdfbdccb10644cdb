#pragma once

#include "flakeid/storage/watermark_store.h"

#include <map>
#include <mutex>
#include <utility>

namespace flakeid::storage {

// Process-local watermark store. Contents are lost on exit, so it only protects
// generators that are recreated within one process.
class InMemoryWatermarkStore final : public IWatermarkStore {
 public:
  InMemoryWatermarkStore() = default;

  [[nodiscard]] core::Result<std::optional<std::int64_t>, std::string> load(
      const core::NodeIdentity& identity) const override;

  [[nodiscard]] core::Result<bool, std::string> save(const core::NodeIdentity& identity,
                                                     std::int64_t last_timestamp_ms) override;

 private:
  using Key = std::pair<std::uint32_t, std::uint32_t>;

  mutable std::mutex mutex_;
  std::map<Key, std::int64_t> watermarks_;
};

}  // namespace flakeid::storage

#pragma once

#include "flakeid/core/node_identity.h"
#include "flakeid/core/result.h"

#include <cstdint>
#include <optional>
#include <string>

namespace flakeid::storage {

// IWatermarkStore checkpoints the last timestamp (Unix ms) a node identity used.
//
// An IdGenerator only detects clock regression within its own lifetime. Loading the
// watermark at startup and passing it as resume_after_ms extends that check across
// process restarts: a node restarted onto a clock that is behind its previous run
// refuses to issue Ids instead of repeating them.
//
// save() is monotonic per identity: a smaller value never replaces a larger one.
class IWatermarkStore {
 public:
  virtual ~IWatermarkStore() = default;

  // Returns nullopt when no watermark has been saved for the identity.
  [[nodiscard]] virtual core::Result<std::optional<std::int64_t>, std::string> load(
      const core::NodeIdentity& identity) const = 0;

  [[nodiscard]] virtual core::Result<bool, std::string> save(const core::NodeIdentity& identity,
                                                             std::int64_t last_timestamp_ms) = 0;

 protected:
  IWatermarkStore() = default;
  IWatermarkStore(const IWatermarkStore&) = default;
  IWatermarkStore& operator=(const IWatermarkStore&) = default;
  IWatermarkStore(IWatermarkStore&&) = default;
  IWatermarkStore& operator=(IWatermarkStore&&) = default;
};

}  // namespace flakeid::storage

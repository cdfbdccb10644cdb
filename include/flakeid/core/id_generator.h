#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/errors.h"
#include "flakeid/core/layout.h"
#include "flakeid/core/node_identity.h"
#include "flakeid/core/result.h"

#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>

namespace flakeid::core {

// IdGenerator issues Snowflake Ids for one node identity.
//
// Contract:
// - Thread-safe. next_id() runs as one critical section under mutex_, so the ordering
//   guarantee holds across all threads sharing an instance.
// - Per instance, the emitted (timestamp, sequence) pairs are strictly increasing.
// - At most 4096 Ids per millisecond. The 4097th call in a millisecond waits on the
//   clock (IClock::wait_for_tick between polls) until the next millisecond; it never
//   fails for throughput reasons.
// - If the clock reads earlier than the last timestamp used (or earlier than
//   kEpochMillis), next_id() returns ClockMovedBackwards and leaves state untouched.
//   No retry or fast-forward happens here; the caller decides what to do.
//
// The clock is held by reference and must outlive the generator.
class IdGenerator {
 public:
  // create validates the identity and builds a generator.
  //
  // resume_after_ms: the last timestamp a previous incarnation of this node is known to
  // have used (see storage::IWatermarkStore). The new generator treats every sequence
  // slot of that millisecond as consumed, so it never reissues a (timestamp, sequence)
  // pair across a restart, and a clock reading below it is reported as
  // ClockMovedBackwards.
  [[nodiscard]] static Result<std::shared_ptr<IdGenerator>, InvalidIdentity> create(
      std::int64_t datacenter_id, std::int64_t worker_id, IClock& clock,
      std::optional<std::int64_t> resume_after_ms = std::nullopt);

  // Same as create() for an identity that is already validated.
  [[nodiscard]] static std::shared_ptr<IdGenerator> from_identity(
      NodeIdentity identity, IClock& clock,
      std::optional<std::int64_t> resume_after_ms = std::nullopt);

  ~IdGenerator() = default;

  // Not copyable or movable (contains mutex)
  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  [[nodiscard]] Result<SnowflakeId, ClockMovedBackwards> next_id();

  [[nodiscard]] const NodeIdentity& identity() const { return identity_; }

  // Unix milliseconds of the most recent Id (or the resume watermark).
  // nullopt before the first Id when no watermark was supplied.
  [[nodiscard]] std::optional<std::int64_t> last_timestamp_ms() const;

 private:
  static constexpr std::int64_t kNoTimestamp = std::numeric_limits<std::int64_t>::min();

  IdGenerator(NodeIdentity identity, IClock& clock, std::optional<std::int64_t> resume_after_ms);

  // Polls the clock until it reads strictly greater than last_timestamp.
  [[nodiscard]] std::int64_t wait_next_millis(std::int64_t last_timestamp);

  const NodeIdentity identity_;
  IClock& clock_;

  mutable std::mutex mutex_;
  std::int64_t last_timestamp_{kNoTimestamp};
  std::int64_t sequence_{0};
};

}  // namespace flakeid::core

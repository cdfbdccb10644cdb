#include "flakeid/core/id_generator.h"

#include <algorithm>

namespace flakeid::core {

Result<std::shared_ptr<IdGenerator>, InvalidIdentity> IdGenerator::create(
    std::int64_t datacenter_id, std::int64_t worker_id, IClock& clock,
    std::optional<std::int64_t> resume_after_ms) {
  using R = Result<std::shared_ptr<IdGenerator>, InvalidIdentity>;

  auto identity = make_node_identity(datacenter_id, worker_id);
  if (!identity.has_value()) {
    return R::err(identity.error());
  }

  return R::ok(from_identity(identity.value(), clock, resume_after_ms));
}

std::shared_ptr<IdGenerator> IdGenerator::from_identity(
    NodeIdentity identity, IClock& clock, std::optional<std::int64_t> resume_after_ms) {
  return std::shared_ptr<IdGenerator>(new IdGenerator(identity, clock, resume_after_ms));
}

IdGenerator::IdGenerator(NodeIdentity identity, IClock& clock,
                         std::optional<std::int64_t> resume_after_ms)
    : identity_(identity), clock_(clock) {
  if (resume_after_ms.has_value()) {
    // Previous incarnation may have used any sequence in that millisecond.
    last_timestamp_ = resume_after_ms.value();
    sequence_ = kMaxSequence;
  }
}

Result<SnowflakeId, ClockMovedBackwards> IdGenerator::next_id() {
  using R = Result<SnowflakeId, ClockMovedBackwards>;

  std::lock_guard<std::mutex> lock(mutex_);

  std::int64_t timestamp = clock_.now_millis();

  // Nothing before the epoch can be encoded, so the epoch acts as the initial floor.
  const std::int64_t floor = std::max(last_timestamp_, kEpochMillis);
  if (timestamp < floor) {
    return R::err(ClockMovedBackwards{floor, timestamp});
  }

  if (timestamp == last_timestamp_) {
    sequence_ = (sequence_ + 1) & kMaxSequence;
    if (sequence_ == 0) {
      // All 4096 slots of this millisecond are used.
      timestamp = wait_next_millis(last_timestamp_);
    }
  } else {
    sequence_ = 0;
  }

  last_timestamp_ = timestamp;

  return R::ok(compose(IdParts{timestamp - kEpochMillis, identity_.datacenter_id(),
                               identity_.worker_id(), static_cast<std::uint32_t>(sequence_)}));
}

std::optional<std::int64_t> IdGenerator::last_timestamp_ms() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (last_timestamp_ == kNoTimestamp) {
    return std::nullopt;
  }
  return last_timestamp_;
}

std::int64_t IdGenerator::wait_next_millis(std::int64_t last_timestamp) {
  std::int64_t timestamp = clock_.now_millis();
  while (timestamp <= last_timestamp) {
    clock_.wait_for_tick();
    timestamp = clock_.now_millis();
  }
  return timestamp;
}

}  // namespace flakeid::core

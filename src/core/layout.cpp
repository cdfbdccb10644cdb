#include "flakeid/core/layout.h"

#include <charconv>
#include <system_error>

namespace flakeid::core {

SnowflakeId compose(const IdParts& parts) {
  const auto timestamp = static_cast<std::uint64_t>(parts.timestamp_offset_ms);
  const auto datacenter = static_cast<std::uint64_t>(parts.datacenter_id) &
                          static_cast<std::uint64_t>(kMaxDatacenterId);
  const auto worker =
      static_cast<std::uint64_t>(parts.worker_id) & static_cast<std::uint64_t>(kMaxWorkerId);
  const auto sequence =
      static_cast<std::uint64_t>(parts.sequence) & static_cast<std::uint64_t>(kMaxSequence);

  return SnowflakeId{(timestamp << kTimestampShift) | (datacenter << kDatacenterIdShift) |
                     (worker << kWorkerIdShift) | sequence};
}

IdParts decompose(SnowflakeId id) {
  IdParts parts;
  parts.timestamp_offset_ms = static_cast<std::int64_t>(id.value >> kTimestampShift);
  parts.datacenter_id = static_cast<std::uint32_t>((id.value >> kDatacenterIdShift) &
                                                   static_cast<std::uint64_t>(kMaxDatacenterId));
  parts.worker_id = static_cast<std::uint32_t>((id.value >> kWorkerIdShift) &
                                               static_cast<std::uint64_t>(kMaxWorkerId));
  parts.sequence =
      static_cast<std::uint32_t>(id.value & static_cast<std::uint64_t>(kMaxSequence));
  return parts;
}

std::int64_t unix_millis(const IdParts& parts) {
  return parts.timestamp_offset_ms + kEpochMillis;
}

std::optional<SnowflakeId> parse_snowflake_id(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  // Digits only: no sign, no whitespace, no hex prefix.
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }

  std::uint64_t value = 0;
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }

  return SnowflakeId{value};
}

std::string to_string(SnowflakeId id) {
  return std::to_string(id.value);
}

}  // namespace flakeid::core

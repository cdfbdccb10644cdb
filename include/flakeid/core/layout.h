#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flakeid::core {

// ────────────────────────────────────────────────────────────────
// Bit layout (MSB -> LSB)
//
//   | 1 reserved | 41 timestamp offset | 5 datacenter | 5 worker | 12 sequence |
//
// These values are shared by every node in the fleet. Changing any of them
// (the epoch included) breaks ordering against Ids already issued.
// ────────────────────────────────────────────────────────────────

// 2025-01-01T00:00:00Z in Unix milliseconds.
inline constexpr std::int64_t kEpochMillis = 1735689600000;

inline constexpr int kSequenceBits = 12;
inline constexpr int kWorkerIdBits = 5;
inline constexpr int kDatacenterIdBits = 5;
inline constexpr int kTimestampBits = 41;

inline constexpr std::int64_t kMaxSequence = (std::int64_t{1} << kSequenceBits) - 1;
inline constexpr std::int64_t kMaxWorkerId = (std::int64_t{1} << kWorkerIdBits) - 1;
inline constexpr std::int64_t kMaxDatacenterId = (std::int64_t{1} << kDatacenterIdBits) - 1;

// The timestamp field is exhausted once (now - kEpochMillis) exceeds this value,
// roughly 69.7 years after the epoch. compose() does not mask the offset, so offsets in
// [2^41, 2^42) spill into the reserved bit: Ids stay ordered as unsigned values but are
// negative when read as int64. From 2^42 on (about 139 years) the high bits are shifted
// out of the word and Ids wrap back towards 0, breaking ordering. Neither case is
// guarded against; decode reports a set reserved bit.
inline constexpr std::int64_t kMaxTimestampOffset = (std::int64_t{1} << kTimestampBits) - 1;

inline constexpr int kWorkerIdShift = kSequenceBits;
inline constexpr int kDatacenterIdShift = kSequenceBits + kWorkerIdBits;
inline constexpr int kTimestampShift = kSequenceBits + kWorkerIdBits + kDatacenterIdBits;

static_assert(1 + kTimestampBits + kDatacenterIdBits + kWorkerIdBits + kSequenceBits == 64,
              "Snowflake fields must tile a 64-bit word");

// SnowflakeId is the 64-bit identifier produced by IdGenerator.
// Vocabulary type (C.11): ordering of values follows generation order per node.
struct SnowflakeId {
  std::uint64_t value{0};  // NOLINT(readability-identifier-naming)
  auto operator<=>(const SnowflakeId&) const = default;
};

// IdParts is the decoded field view of a SnowflakeId.
// timestamp_offset_ms is relative to kEpochMillis.
struct IdParts {
  std::int64_t timestamp_offset_ms{0};  // NOLINT(readability-identifier-naming)
  std::uint32_t datacenter_id{0};       // NOLINT(readability-identifier-naming)
  std::uint32_t worker_id{0};           // NOLINT(readability-identifier-naming)
  std::uint32_t sequence{0};            // NOLINT(readability-identifier-naming)
  auto operator<=>(const IdParts&) const = default;
};

// compose packs fields into an Id. datacenter_id, worker_id and sequence are masked
// to their bit widths; timestamp_offset_ms is shifted as-is (see kMaxTimestampOffset).
// Precondition: 0 <= timestamp_offset_ms < 2^42; larger offsets lose their high bits.
[[nodiscard]] SnowflakeId compose(const IdParts& parts);

// decompose splits an Id into its fields. The timestamp field takes every bit above
// the datacenter field (reserved bit included), so compose(decompose(id)) == id for
// any 64-bit value.
[[nodiscard]] IdParts decompose(SnowflakeId id);

// unix_millis converts a decoded timestamp offset back to Unix milliseconds.
[[nodiscard]] std::int64_t unix_millis(const IdParts& parts);

// parse_snowflake_id accepts an unsigned decimal string that fits in 64 bits.
// Returns nullopt for empty input, signs, whitespace, non-digits or overflow.
[[nodiscard]] std::optional<SnowflakeId> parse_snowflake_id(std::string_view text);

[[nodiscard]] std::string to_string(SnowflakeId id);

}  // namespace flakeid::core

#pragma once

#include <cstdint>
#include <string>

namespace flakeid::core {

// Error types following E.14 (use purpose-designed types as error indicators).
// Each carries the values needed to report the failure without extra context.

enum class IdentityField {
  kDatacenterId,
  kWorkerId,
};

// A datacenter or worker id outside [0, 31]. Raised at construction only.
struct InvalidIdentity {
  IdentityField field{IdentityField::kDatacenterId};  // NOLINT(readability-identifier-naming)
  std::int64_t value{0};                              // NOLINT(readability-identifier-naming)
  auto operator<=>(const InvalidIdentity&) const = default;
};

// The clock reported a time earlier than the last timestamp used for an Id.
// last_timestamp_ms and observed_ms are Unix milliseconds.
struct ClockMovedBackwards {
  std::int64_t last_timestamp_ms{0};  // NOLINT(readability-identifier-naming)
  std::int64_t observed_ms{0};        // NOLINT(readability-identifier-naming)
  auto operator<=>(const ClockMovedBackwards&) const = default;

  [[nodiscard]] std::int64_t regression_ms() const { return last_timestamp_ms - observed_ms; }
};

[[nodiscard]] std::string to_string(IdentityField field);
[[nodiscard]] std::string to_string(const InvalidIdentity& error);
[[nodiscard]] std::string to_string(const ClockMovedBackwards& error);

}  // namespace flakeid::core

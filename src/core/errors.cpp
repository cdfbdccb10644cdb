#include "flakeid/core/errors.h"

#include "flakeid/core/layout.h"

namespace flakeid::core {

std::string to_string(IdentityField field) {
  switch (field) {
    case IdentityField::kDatacenterId:
      return "datacenter-id";
    case IdentityField::kWorkerId:
      return "worker-id";
  }
  return "unknown";
}

std::string to_string(const InvalidIdentity& error) {
  const std::int64_t max =
      error.field == IdentityField::kDatacenterId ? kMaxDatacenterId : kMaxWorkerId;
  return "invalid " + to_string(error.field) + " " + std::to_string(error.value) +
         " (must be between 0 and " + std::to_string(max) + ")";
}

std::string to_string(const ClockMovedBackwards& error) {
  return "clock moved backwards: refusing to generate id for " +
         std::to_string(error.regression_ms()) + " ms (last timestamp " +
         std::to_string(error.last_timestamp_ms) + ", observed " +
         std::to_string(error.observed_ms) + ")";
}

}  // namespace flakeid::core

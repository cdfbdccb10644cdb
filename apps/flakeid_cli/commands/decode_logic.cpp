#include "decode_logic.h"

#include "flakeid/core/layout.h"
#include "flakeid/domain/decoded_id.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace flakeid::cli {

std::string format_utc_millis(std::int64_t unix_ms) {
  // Floor division so pre-1970 values keep a non-negative millisecond part.
  std::int64_t seconds = unix_ms / 1000;
  std::int64_t millis = unix_ms % 1000;
  if (millis < 0) {
    millis += 1000;
    --seconds;
  }

  const auto time_t_value = static_cast<std::time_t>(seconds);
  const std::tm* utc = std::gmtime(&time_t_value);
  if (utc == nullptr) {
    return std::to_string(unix_ms) + "ms";
  }

  std::ostringstream oss;
  oss << std::put_time(utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return oss.str();
}

int execute_decode(const std::string& text, bool json, std::ostream& out, std::ostream& err) {
  const auto id = core::parse_snowflake_id(text);
  if (!id.has_value()) {
    err << "Error: '" << text << "' is not a valid id (expected an unsigned 64-bit decimal)\n";
    return 1;
  }

  if (json) {
    out << domain::decoded_id_to_json(id.value()).dump(2) << "\n";
    return 0;
  }

  const core::IdParts parts = core::decompose(id.value());
  const std::int64_t unix_ms = core::unix_millis(parts);

  out << "id:                  " << id->value << "\n"
      << "timestamp_offset_ms: " << parts.timestamp_offset_ms << "\n"
      << "unix_ms:             " << unix_ms << "\n"
      << "utc:                 " << format_utc_millis(unix_ms) << "\n"
      << "datacenter_id:       " << parts.datacenter_id << "\n"
      << "worker_id:           " << parts.worker_id << "\n"
      << "sequence:            " << parts.sequence << "\n";

  if (parts.timestamp_offset_ms > core::kMaxTimestampOffset) {
    err << "WARNING: reserved bit is set; this id lies beyond the 41-bit timestamp ceiling\n";
  }

  return 0;
}

}  // namespace flakeid::cli

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace flakeid::cli {

// execute_decode parses text as an unsigned decimal Id and prints its fields.
// Plain output is one "name: value" line per field plus the UTC time; JSON output is
// domain::decoded_id_to_json().
//
// Returns: 0 on success, 1 if text is not a valid Id (message written to err).
int execute_decode(const std::string& text, bool json, std::ostream& out, std::ostream& err);

// format_utc_millis renders Unix milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ".
[[nodiscard]] std::string format_utc_millis(std::int64_t unix_ms);

}  // namespace flakeid::cli

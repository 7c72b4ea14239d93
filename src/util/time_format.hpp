#pragma once

#include <chrono>
#include <string>

namespace mangashelf {

using Timestamp = std::chrono::system_clock::time_point;

// "2024-01-31T10:00:00Z" (UTC, second precision).
std::string format_rfc3339(Timestamp t);

// Accepts "YYYY-MM-DDTHH:MM:SS" followed by an optional fractional part and
// "Z" or a "+HH:MM" / "-HH:MM" offset. Returns false on malformed text.
bool parse_rfc3339(const std::string& text, Timestamp& out);

// Current time truncated to whole seconds, so that a saved record
// round-trips exactly.
Timestamp now_seconds();

} // namespace mangashelf

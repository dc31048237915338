#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace tmd {

using Timestamp = std::chrono::system_clock::time_point;

// Current wall-clock time truncated to microseconds, the precision kept in manifests
Timestamp now_utc();

/**
 * Format as RFC 3339 UTC with microsecond precision,
 * e.g. "2025-03-01T12:30:45.123456Z".
 */
std::string format_rfc3339(Timestamp ts);

/**
 * Parse "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)".
 * Fractions beyond microseconds are truncated.
 */
std::optional<Timestamp> parse_rfc3339(const std::string& text);

}  // namespace tmd

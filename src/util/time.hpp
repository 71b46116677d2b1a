#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace rollout::util {

using Timestamp = std::chrono::system_clock::time_point;

// RFC 3339 in UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z.
std::string FormatRfc3339(Timestamp when);

// Accepts the format produced by FormatRfc3339 (fractional seconds optional).
std::optional<Timestamp> ParseRfc3339(std::string_view text);

// Current time truncated to milliseconds so that values survive a
// format/parse round trip unchanged.
Timestamp NowMillis();

}  // namespace rollout::util

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace kasstamp::util {

// "2025-01-31T08:15:42.123Z"
std::string FormatIso8601Utc(std::chrono::system_clock::time_point when);
std::string Iso8601NowUtc();

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and either
// a 'Z' suffix or a +HH:MM / -HH:MM offset. A bare date is also accepted.
std::optional<std::chrono::system_clock::time_point> ParseIso8601(std::string_view text);

}  // namespace kasstamp::util

#pragma once

#include <ddlogs_mcp/core/result.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace ddlogs_mcp {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ---------------------------------------------------------------------------
// RFC 3339 timestamps
//
// Accepted: YYYY-MM-DDTHH:MM:SS[.fraction](Z|+hh:mm|-hh:mm)
// Calendar fields are range-checked (including day-of-month and leap years).
// ---------------------------------------------------------------------------
[[nodiscard]] Result<TimePoint, std::string> ParseRfc3339(std::string_view text);

/// UTC, whole seconds: "2026-01-20T10:00:00Z".
[[nodiscard]] std::string FormatRfc3339(TimePoint tp);

/// UTC, milliseconds: "2026-01-20T10:00:00.123Z".
[[nodiscard]] std::string FormatRfc3339Millis(TimePoint tp);

// ---------------------------------------------------------------------------
// Durations in Go notation: an optional sign followed by one or more
// decimal numbers, each with an optional fraction and a mandatory unit,
// e.g. "1h", "30m", "1h30m", "1.5h", "-2m45s", "300ms". "0" needs no unit.
// Units: ns, us, µs, μs, ms, s, m, h.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::chrono::nanoseconds, std::string> ParseDuration(
    std::string_view text);

} // namespace ddlogs_mcp

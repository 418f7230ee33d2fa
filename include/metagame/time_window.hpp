#pragma once

#include "metagame/types.hpp"
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace metagame {

inline constexpr int min_period_days = 1;
inline constexpr int max_period_days = 365;

// Previous period given as offsets from "now" instead of a length.
struct PreviousOffsets {
    int start_days_ago = 0;
    int end_days_ago = 0;
};

// Contiguous windows: [now - current - previous, now - current) and [now - current, now).
std::expected<TimeWindows, AnalyticsError> compute_time_windows(
    int current_days, int previous_days, TimePoint now);

std::expected<TimeWindows, AnalyticsError> compute_time_windows(
    int current_days, const PreviousOffsets& previous, TimePoint now);

// `days` must lie in [min_period_days, max_period_days].
std::expected<Period, AnalyticsError> compute_period(int days, TimePoint now);

// Rejects empty periods and a previous period that overlaps the current one.
std::expected<void, AnalyticsError> validate_windows(const TimeWindows& windows);

std::string to_iso8601(TimePoint tp);
// YYYY-MM-DD or YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]; no designator means UTC.
std::optional<TimePoint> parse_iso8601(std::string_view s);

} // namespace metagame

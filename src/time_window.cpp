#include "metagame/time_window.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace metagame {

namespace {

AnalyticsError validation_error(std::string message) {
    return AnalyticsError{ErrorKind::Validation, std::move(message)};
}

// Reads exactly `width` decimal digits at `pos` and advances past them.
std::optional<int> read_digits(std::string_view s, std::size_t& pos, std::size_t width) {
    if (pos + width > s.size()) return std::nullopt;
    int value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        char c = s[pos + i];
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + (c - '0');
    }
    pos += width;
    return value;
}

bool consume(std::string_view s, std::size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

// "Z", "+HH:MM" or "-HH:MM" as seconds east of UTC. An empty designator is UTC.
std::optional<int> parse_utc_offset(std::string_view s) {
    if (s.empty() || s == "Z") return 0;
    if (s.size() != 6 || (s[0] != '+' && s[0] != '-')) return std::nullopt;

    std::size_t pos = 1;
    auto hours = read_digits(s, pos, 2);
    if (!hours || !consume(s, pos, ':')) return std::nullopt;
    auto minutes = read_digits(s, pos, 2);
    if (!minutes || *hours > 23 || *minutes > 59) return std::nullopt;

    int offset = *hours * 3600 + *minutes * 60;
    return s[0] == '-' ? -offset : offset;
}

} // namespace

std::expected<Period, AnalyticsError> compute_period(int days, TimePoint now) {
    if (days < min_period_days || days > max_period_days) {
        return std::unexpected(validation_error(
            "period length must be between " + std::to_string(min_period_days) + " and " +
            std::to_string(max_period_days) + " days, got " + std::to_string(days)));
    }
    return Period{
        .days = days,
        .start = now - std::chrono::days(days),
        .end = now,
    };
}

std::expected<TimeWindows, AnalyticsError> compute_time_windows(
    int current_days, int previous_days, TimePoint now) {

    auto current = compute_period(current_days, now);
    if (!current) return std::unexpected(current.error());

    auto previous = compute_period(previous_days, current->start);
    if (!previous) return std::unexpected(previous.error());

    return TimeWindows{.current = *current, .previous = *previous};
}

std::expected<TimeWindows, AnalyticsError> compute_time_windows(
    int current_days, const PreviousOffsets& previous, TimePoint now) {

    auto current = compute_period(current_days, now);
    if (!current) return std::unexpected(current.error());

    if (previous.start_days_ago <= 0 || previous.end_days_ago < 0 ||
        previous.start_days_ago > max_period_days || previous.end_days_ago > max_period_days) {
        return std::unexpected(validation_error(
            "previous period offsets must be day counts between 0 and " +
            std::to_string(max_period_days) + " (start " +
            std::to_string(previous.start_days_ago) + ", end " +
            std::to_string(previous.end_days_ago) + ")"));
    }

    TimeWindows windows{
        .current = *current,
        .previous = {
            .days = previous.start_days_ago - previous.end_days_ago,
            .start = now - std::chrono::days(previous.start_days_ago),
            .end = now - std::chrono::days(previous.end_days_ago),
        },
    };

    if (auto ok = validate_windows(windows); !ok) {
        return std::unexpected(ok.error());
    }
    return windows;
}

std::expected<void, AnalyticsError> validate_windows(const TimeWindows& windows) {
    auto& cur = windows.current;
    auto& prev = windows.previous;

    if (cur.start >= cur.end) {
        return std::unexpected(validation_error(
            "current period is empty: start " + to_iso8601(cur.start) +
            " is not before end " + to_iso8601(cur.end)));
    }
    if (prev.start >= prev.end) {
        return std::unexpected(validation_error(
            "previous period is empty: start " + to_iso8601(prev.start) +
            " is not before end " + to_iso8601(prev.end)));
    }
    if (prev.end > cur.start) {
        return std::unexpected(validation_error(
            "previous period [" + to_iso8601(prev.start) + ", " + to_iso8601(prev.end) +
            ") overlaps current period [" + to_iso8601(cur.start) + ", " +
            to_iso8601(cur.end) + ")"));
    }
    return {};
}

std::string to_iso8601(TimePoint tp) {
    auto tt = std::chrono::system_clock::to_time_t(
        std::chrono::floor<std::chrono::seconds>(tp));
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<TimePoint> parse_iso8601(std::string_view s) {
    std::size_t pos = 0;
    auto year = read_digits(s, pos, 4);
    if (!year || !consume(s, pos, '-')) return std::nullopt;
    auto month = read_digits(s, pos, 2);
    if (!month || !consume(s, pos, '-')) return std::nullopt;
    auto day = read_digits(s, pos, 2);
    if (!day) return std::nullopt;

    std::tm tm{};
    tm.tm_year = *year - 1900;
    tm.tm_mon = *month - 1;
    tm.tm_mday = *day;
    int offset_seconds = 0;

    // Date-only strings are accepted as midnight UTC
    if (pos < s.size()) {
        if (!consume(s, pos, 'T')) return std::nullopt;
        auto hour = read_digits(s, pos, 2);
        if (!hour || !consume(s, pos, ':')) return std::nullopt;
        auto minute = read_digits(s, pos, 2);
        if (!minute || !consume(s, pos, ':')) return std::nullopt;
        auto second = read_digits(s, pos, 2);
        if (!second) return std::nullopt;
        tm.tm_hour = *hour;
        tm.tm_min = *minute;
        tm.tm_sec = *second;

        // Fractional seconds are truncated
        if (consume(s, pos, '.')) {
            std::size_t first = pos;
            while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') ++pos;
            if (pos == first) return std::nullopt;
        }

        auto offset = parse_utc_offset(s.substr(pos));
        if (!offset) return std::nullopt;
        offset_seconds = *offset;
    }

    std::tm normalized = tm;
    std::time_t tt = timegm(&normalized);

    // timegm normalizes impossible fields (Feb 31 becomes Mar 2); require an exact round trip
    std::tm check{};
    gmtime_r(&tt, &check);
    if (check.tm_year != tm.tm_year || check.tm_mon != tm.tm_mon || check.tm_mday != tm.tm_mday ||
        check.tm_hour != tm.tm_hour || check.tm_min != tm.tm_min || check.tm_sec != tm.tm_sec) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(tt) - std::chrono::seconds(offset_seconds);
}

} // namespace metagame

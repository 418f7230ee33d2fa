#include "metagame/query.hpp"
#include "metagame/rankings.hpp"
#include <algorithm>
#include <cctype>

namespace metagame {

namespace {

AnalyticsError invalid(std::string message) {
    return AnalyticsError{ErrorKind::Validation, std::move(message)};
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::expected<void, AnalyticsError> check_days(std::string_view field, int days) {
    if (days < min_period_days || days > max_period_days) {
        return std::unexpected(invalid(
            std::string(field) + " must be between " + std::to_string(min_period_days) +
            " and " + std::to_string(max_period_days) + ", got " + std::to_string(days)));
    }
    return {};
}

std::expected<void, AnalyticsError> check_format(const std::string& format) {
    if (format.empty()) return std::unexpected(invalid("format is required"));
    return {};
}

} // namespace

std::expected<RankingsQuery, AnalyticsError> normalize_rankings_query(RankingsQuery query) {
    if (auto ok = check_format(query.format); !ok) return std::unexpected(ok.error());
    if (auto ok = check_days("current_days", query.current_days); !ok) {
        return std::unexpected(ok.error());
    }

    if (query.previous_offsets) {
        auto& off = *query.previous_offsets;
        if (auto ok = check_days("previous_start_days", off.start_days_ago); !ok) {
            return std::unexpected(ok.error());
        }
        if (off.end_days_ago < 0 || off.end_days_ago > max_period_days) {
            return std::unexpected(invalid(
                "previous_end_days must be between 0 and " + std::to_string(max_period_days) +
                ", got " + std::to_string(off.end_days_ago)));
        }
    } else if (auto ok = check_days("previous_days", query.previous_days); !ok) {
        return std::unexpected(ok.error());
    }

    if (query.min_matches) {
        auto min = validate_min_matches(*query.min_matches);
        if (!min) return std::unexpected(min.error());
    }

    if (query.strategy) {
        auto lowered = to_lower(*query.strategy);
        if (std::ranges::find(strategies, std::string_view(lowered)) == strategies.end()) {
            return std::unexpected(invalid(
                "strategy must be one of aggro, midrange, control, ramp, combo; got '" +
                *query.strategy + "'"));
        }
        query.strategy = std::move(lowered);
    }

    if (query.group_by) {
        auto lowered = to_lower(*query.group_by);
        if (auto field = parse_group_field(lowered); !field) {
            return std::unexpected(field.error());
        }
        query.group_by = std::move(lowered);
    }

    return query;
}

std::expected<MatchupQuery, AnalyticsError> normalize_matchup_query(MatchupQuery query) {
    if (auto ok = check_format(query.format); !ok) return std::unexpected(ok.error());
    if (auto ok = check_days("days", query.days); !ok) return std::unexpected(ok.error());
    if (query.min_matches) {
        auto min = validate_min_matches(*query.min_matches);
        if (!min) return std::unexpected(min.error());
    }
    return query;
}

std::expected<int, AnalyticsError> validate_min_matches(int min_matches) {
    if (min_matches < 1) {
        return std::unexpected(invalid(
            "min_matches must be at least 1, got " + std::to_string(min_matches)));
    }
    return min_matches;
}

} // namespace metagame

#pragma once

#include "metagame/engine.hpp"
#include <array>
#include <expected>
#include <string_view>

namespace metagame {

inline constexpr std::array<std::string_view, 5> strategies = {
    "aggro", "midrange", "control", "ramp", "combo",
};

// Request-level checks: day bounds, strategy vocabulary, group_by field.
// Strategy and group_by are lower-cased in place.
std::expected<RankingsQuery, AnalyticsError> normalize_rankings_query(RankingsQuery query);
std::expected<MatchupQuery, AnalyticsError> normalize_matchup_query(MatchupQuery query);

std::expected<int, AnalyticsError> validate_min_matches(int min_matches);

} // namespace metagame

#pragma once

#include "metagame/time_window.hpp"
#include "metagame/types.hpp"
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace metagame {

// Fetch rows for one format in the half-open range [start, end).
using ArchetypeFetcher = std::function<std::expected<std::vector<ArchetypeRow>, AnalyticsError>(
    const std::string& format, TimePoint start, TimePoint end)>;

using MatchFetcher = std::function<std::expected<std::vector<MatchRow>, AnalyticsError>(
    const std::string& format, TimePoint start, TimePoint end)>;

struct RowSource {
    ArchetypeFetcher archetypes;
    MatchFetcher matches;
};

struct RankingsQuery {
    std::string format;
    int current_days = 14;
    int previous_days = 14;
    std::optional<PreviousOffsets> previous_offsets; // overrides previous_days
    std::optional<std::string> color_identity;
    std::optional<std::string> strategy;
    std::optional<std::string> group_by;
    std::optional<int> min_matches; // overrides the engine default
};

struct MatchupQuery {
    std::string format;
    int days = 14;
    std::optional<int> min_matches;
};

class MetaAnalyticsEngine {
public:
    explicit MetaAnalyticsEngine(RowSource source, int min_matches = default_min_matches);

    std::expected<RankingsReport, AnalyticsError> rankings(
        const RankingsQuery& query,
        TimePoint now = std::chrono::system_clock::now()) const;

    std::expected<MatchupReport, AnalyticsError> matchup_matrix(
        const MatchupQuery& query,
        TimePoint now = std::chrono::system_clock::now()) const;

    int min_matches() const { return min_matches_; }

private:
    RowSource source_;
    int min_matches_;
};

} // namespace metagame

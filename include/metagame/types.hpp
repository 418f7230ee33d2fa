#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace metagame {

using TimePoint = std::chrono::system_clock::time_point;
using ArchetypeId = std::int64_t;

inline constexpr int default_min_matches = 3;

// Input rows (supplied by a RowSource)

struct ArchetypeRow {
    ArchetypeId archetype_id = 0;
    std::string format;
    std::string main_title;
    std::optional<std::string> color_identity;
    std::string strategy;
    TimePoint tournament_date;
};

struct MatchRow {
    std::string format;
    ArchetypeId player_archetype_id = 0;
    std::string player_archetype_name;
    ArchetypeId opponent_archetype_id = 0;
    std::string opponent_archetype_name;
    std::string player1_id;
    std::string player2_id;
    std::string winner_id;
    TimePoint tournament_date;
};

// Analytics output types

struct ShareResult {
    ArchetypeId archetype_id = 0;
    std::string main_title;
    std::optional<std::string> color_identity;
    std::string strategy;
    int sample_size = 0;
    double meta_share = 0.0;
};

struct WinRateResult {
    ArchetypeId archetype_id = 0;
    std::string main_title;
    int wins = 0;
    int match_count = 0;
    std::optional<double> win_rate; // absent below min_matches
};

struct RankingRow {
    std::optional<ArchetypeId> archetype_id; // absent on grouped rows
    std::string main_title;
    std::optional<std::string> color_identity;
    std::string strategy;

    double meta_share_current = 0.0;
    int sample_size_current = 0;
    std::optional<double> meta_share_previous;
    std::optional<int> sample_size_previous;

    std::optional<double> win_rate_current;
    std::optional<int> match_count_current;
    std::optional<double> win_rate_previous;
    std::optional<int> match_count_previous;

    bool grouped = false;

    std::optional<double> meta_share_delta() const {
        if (!meta_share_previous) return std::nullopt;
        return meta_share_current - *meta_share_previous;
    }
};

struct MatchupCell {
    std::optional<double> win_rate;
    int wins = 0;
    int match_count = 0;
};

// player archetype -> opponent archetype -> cell, keyed by archetype name
using MatchupMatrix = std::map<std::string, std::map<std::string, MatchupCell>>;

enum class GroupField {
    ColorIdentity,
    Strategy,
};

// Time windows

struct Period {
    int days = 0;
    TimePoint start; // inclusive
    TimePoint end;   // exclusive
};

struct TimeWindows {
    Period current;
    Period previous;
};

struct ReportMetadata {
    std::string format;
    Period current;
    std::optional<Period> previous;
    TimePoint generated_at;
};

struct RankingsReport {
    std::vector<RankingRow> rows;
    ReportMetadata metadata;
};

struct MatchupReport {
    MatchupMatrix matrix;
    std::vector<std::string> archetypes;
    ReportMetadata metadata;
};

// Errors

enum class ErrorKind {
    Validation,
    Upstream,
};

struct AnalyticsError {
    ErrorKind kind = ErrorKind::Validation;
    std::string message;
};

} // namespace metagame

#pragma once

#include "metagame/types.hpp"
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace metagame {

inline constexpr std::string_view grouped_title = "grouped";

// Left-outer joins onto the current period's shares, keyed by archetype_id.
std::vector<RankingRow> merge_periods(
    const std::vector<ShareResult>& current_share,
    const std::vector<ShareResult>& previous_share,
    const std::vector<WinRateResult>& current_wins,
    const std::vector<WinRateResult>& previous_wins);

std::vector<RankingRow> filter_by_color_identity(
    std::vector<RankingRow> rows, const std::string& color_identity);

std::vector<RankingRow> filter_by_strategy(
    std::vector<RankingRow> rows, const std::string& strategy);

// Collapses rows sharing the field's value into one bucket row. Win rates are an
// unweighted mean of the members that have one.
std::vector<RankingRow> group_rankings(
    const std::vector<RankingRow>& rows, GroupField field);

// meta_share_current descending, ties by main_title then strategy.
void sort_rankings(std::vector<RankingRow>& rows);

std::expected<GroupField, AnalyticsError> parse_group_field(std::string_view name);

} // namespace metagame

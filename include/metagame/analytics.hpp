#pragma once

#include "metagame/types.hpp"
#include <string>
#include <vector>

namespace metagame {

// Decklist count and percentage of field per archetype. Unordered.
std::vector<ShareResult> compute_meta_share(
    const std::vector<ArchetypeRow>& rows);

// Each match counts once for each seat. win_rate is absent below min_matches.
std::vector<WinRateResult> compute_win_rates(
    const std::vector<MatchRow>& matches, int min_matches = default_min_matches);

MatchupMatrix compute_matchup_matrix(
    const std::vector<MatchRow>& matches, int min_matches = default_min_matches);

// Player-side archetype names of the matrix, ascending.
std::vector<std::string> matrix_archetypes(const MatchupMatrix& matrix);

} // namespace metagame

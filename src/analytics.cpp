#include "metagame/analytics.hpp"
#include <unordered_map>
#include <utility>

namespace metagame {

namespace {

struct Observation {
    ArchetypeId archetype_id = 0;
    const std::string* name = nullptr;
    bool won = false;
};

// One observation per seat: player1 plays the player archetype, player2 the opponent.
std::pair<Observation, Observation> expand_seats(const MatchRow& m) {
    return {
        {m.player_archetype_id, &m.player_archetype_name, m.winner_id == m.player1_id},
        {m.opponent_archetype_id, &m.opponent_archetype_name, m.winner_id == m.player2_id},
    };
}

std::optional<double> suppressed_win_rate(int wins, int match_count, int min_matches) {
    if (match_count <= 0 || match_count < min_matches) return std::nullopt;
    return static_cast<double>(wins) / match_count * 100.0;
}

} // namespace

std::vector<ShareResult> compute_meta_share(const std::vector<ArchetypeRow>& rows) {
    if (rows.empty()) return {};

    std::vector<ShareResult> result;
    std::unordered_map<ArchetypeId, size_t> index;

    for (auto& row : rows) {
        auto [it, inserted] = index.try_emplace(row.archetype_id, result.size());
        if (inserted) {
            result.push_back({
                .archetype_id = row.archetype_id,
                .main_title = row.main_title,
                .color_identity = row.color_identity,
                .strategy = row.strategy,
            });
        }
        result[it->second].sample_size++;
    }

    int total = static_cast<int>(rows.size());
    for (auto& share : result) {
        share.meta_share = static_cast<double>(share.sample_size) / total * 100.0;
    }

    return result;
}

std::vector<WinRateResult> compute_win_rates(
    const std::vector<MatchRow>& matches, int min_matches) {

    std::vector<WinRateResult> result;
    std::unordered_map<ArchetypeId, size_t> index;

    auto record = [&](const Observation& obs) {
        auto [it, inserted] = index.try_emplace(obs.archetype_id, result.size());
        if (inserted) {
            result.push_back({.archetype_id = obs.archetype_id, .main_title = *obs.name});
        }
        auto& acc = result[it->second];
        acc.match_count++;
        acc.wins += obs.won ? 1 : 0;
    };

    for (auto& m : matches) {
        auto [player, opponent] = expand_seats(m);
        record(player);
        record(opponent);
    }

    for (auto& wr : result) {
        wr.win_rate = suppressed_win_rate(wr.wins, wr.match_count, min_matches);
    }

    return result;
}

MatchupMatrix compute_matchup_matrix(
    const std::vector<MatchRow>& matches, int min_matches) {

    MatchupMatrix matrix;

    for (auto& m : matches) {
        auto [player, opponent] = expand_seats(m);

        auto& forward = matrix[*player.name][*opponent.name];
        forward.match_count++;
        forward.wins += player.won ? 1 : 0;

        auto& reverse = matrix[*opponent.name][*player.name];
        reverse.match_count++;
        reverse.wins += opponent.won ? 1 : 0;
    }

    for (auto& [player_name, row] : matrix) {
        for (auto& [opponent_name, cell] : row) {
            cell.win_rate = suppressed_win_rate(cell.wins, cell.match_count, min_matches);
        }
    }

    return matrix;
}

std::vector<std::string> matrix_archetypes(const MatchupMatrix& matrix) {
    std::vector<std::string> names;
    names.reserve(matrix.size());
    for (auto& [name, _] : matrix) names.push_back(name);
    return names;
}

} // namespace metagame

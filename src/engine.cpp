#include "metagame/engine.hpp"
#include "metagame/analytics.hpp"
#include "metagame/rankings.hpp"

namespace metagame {

namespace {

AnalyticsError missing_fetcher(const char* what) {
    return AnalyticsError{ErrorKind::Upstream, std::string("row source has no ") + what + " fetcher"};
}

AnalyticsError invalid_min_matches(int value) {
    return AnalyticsError{ErrorKind::Validation,
                          "min_matches must be at least 1, got " + std::to_string(value)};
}

} // namespace

MetaAnalyticsEngine::MetaAnalyticsEngine(RowSource source, int min_matches)
    : source_(std::move(source)), min_matches_(min_matches) {}

std::expected<RankingsReport, AnalyticsError> MetaAnalyticsEngine::rankings(
    const RankingsQuery& query, TimePoint now) const {

    // Everything that can be rejected is rejected before the first fetch.
    auto windows = query.previous_offsets
        ? compute_time_windows(query.current_days, *query.previous_offsets, now)
        : compute_time_windows(query.current_days, query.previous_days, now);
    if (!windows) return std::unexpected(windows.error());

    int min_matches = query.min_matches.value_or(min_matches_);
    if (min_matches < 1) return std::unexpected(invalid_min_matches(min_matches));

    std::optional<GroupField> group_field;
    if (query.group_by) {
        auto parsed = parse_group_field(*query.group_by);
        if (!parsed) return std::unexpected(parsed.error());
        group_field = *parsed;
    }

    if (!source_.archetypes) return std::unexpected(missing_fetcher("archetype"));
    if (!source_.matches) return std::unexpected(missing_fetcher("match"));

    auto& cur = windows->current;
    auto& prev = windows->previous;

    auto current_decks = source_.archetypes(query.format, cur.start, cur.end);
    if (!current_decks) return std::unexpected(current_decks.error());
    auto previous_decks = source_.archetypes(query.format, prev.start, prev.end);
    if (!previous_decks) return std::unexpected(previous_decks.error());

    auto current_matches = source_.matches(query.format, cur.start, cur.end);
    if (!current_matches) return std::unexpected(current_matches.error());
    auto previous_matches = source_.matches(query.format, prev.start, prev.end);
    if (!previous_matches) return std::unexpected(previous_matches.error());

    auto rows = merge_periods(
        compute_meta_share(*current_decks),
        compute_meta_share(*previous_decks),
        compute_win_rates(*current_matches, min_matches),
        compute_win_rates(*previous_matches, min_matches));

    if (query.color_identity) rows = filter_by_color_identity(std::move(rows), *query.color_identity);
    if (query.strategy) rows = filter_by_strategy(std::move(rows), *query.strategy);
    if (group_field) rows = group_rankings(rows, *group_field);

    sort_rankings(rows);

    return RankingsReport{
        .rows = std::move(rows),
        .metadata = {
            .format = query.format,
            .current = cur,
            .previous = prev,
            .generated_at = std::chrono::system_clock::now(),
        },
    };
}

std::expected<MatchupReport, AnalyticsError> MetaAnalyticsEngine::matchup_matrix(
    const MatchupQuery& query, TimePoint now) const {

    auto period = compute_period(query.days, now);
    if (!period) return std::unexpected(period.error());

    int min_matches = query.min_matches.value_or(min_matches_);
    if (min_matches < 1) return std::unexpected(invalid_min_matches(min_matches));

    if (!source_.matches) return std::unexpected(missing_fetcher("match"));

    auto matches = source_.matches(query.format, period->start, period->end);
    if (!matches) return std::unexpected(matches.error());

    auto matrix = compute_matchup_matrix(*matches, min_matches);
    auto archetypes = matrix_archetypes(matrix);

    return MatchupReport{
        .matrix = std::move(matrix),
        .archetypes = std::move(archetypes),
        .metadata = {
            .format = query.format,
            .current = *period,
            .previous = std::nullopt,
            .generated_at = std::chrono::system_clock::now(),
        },
    };
}

} // namespace metagame

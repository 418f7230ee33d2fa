#include "metagame/rankings.hpp"
#include <algorithm>
#include <iterator>
#include <unordered_map>

namespace metagame {

namespace {

template <typename Result>
std::unordered_map<ArchetypeId, const Result*> index_by_id(const std::vector<Result>& results) {
    std::unordered_map<ArchetypeId, const Result*> index;
    for (auto& r : results) index.emplace(r.archetype_id, &r);
    return index;
}

template <typename T>
void add_optional(std::optional<T>& total, const std::optional<T>& value) {
    if (!value) return;
    total = total.value_or(T{}) + *value;
}

struct Bucket {
    std::optional<std::string> key;
    RankingRow row;
    double win_rate_current_sum = 0.0;
    int win_rate_current_n = 0;
    double win_rate_previous_sum = 0.0;
    int win_rate_previous_n = 0;
};

} // namespace

std::vector<RankingRow> merge_periods(
    const std::vector<ShareResult>& current_share,
    const std::vector<ShareResult>& previous_share,
    const std::vector<WinRateResult>& current_wins,
    const std::vector<WinRateResult>& previous_wins) {

    auto prev_share_by_id = index_by_id(previous_share);
    auto cur_wins_by_id = index_by_id(current_wins);
    auto prev_wins_by_id = index_by_id(previous_wins);

    std::vector<RankingRow> result;
    result.reserve(current_share.size());

    for (auto& share : current_share) {
        RankingRow row{
            .archetype_id = share.archetype_id,
            .main_title = share.main_title,
            .color_identity = share.color_identity,
            .strategy = share.strategy,
            .meta_share_current = share.meta_share,
            .sample_size_current = share.sample_size,
        };

        if (auto it = prev_share_by_id.find(share.archetype_id); it != prev_share_by_id.end()) {
            row.meta_share_previous = it->second->meta_share;
            row.sample_size_previous = it->second->sample_size;
        }

        if (auto it = cur_wins_by_id.find(share.archetype_id); it != cur_wins_by_id.end()) {
            row.win_rate_current = it->second->win_rate;
            row.match_count_current = it->second->match_count;
        }

        if (auto it = prev_wins_by_id.find(share.archetype_id); it != prev_wins_by_id.end()) {
            row.win_rate_previous = it->second->win_rate;
            row.match_count_previous = it->second->match_count;
        }

        result.push_back(std::move(row));
    }

    return result;
}

std::vector<RankingRow> filter_by_color_identity(
    std::vector<RankingRow> rows, const std::string& color_identity) {
    std::erase_if(rows, [&](const RankingRow& r) {
        return !r.color_identity || *r.color_identity != color_identity;
    });
    return rows;
}

std::vector<RankingRow> filter_by_strategy(
    std::vector<RankingRow> rows, const std::string& strategy) {
    std::erase_if(rows, [&](const RankingRow& r) { return r.strategy != strategy; });
    return rows;
}

std::vector<RankingRow> group_rankings(
    const std::vector<RankingRow>& rows, GroupField field) {

    std::vector<Bucket> buckets;

    for (auto& r : rows) {
        std::optional<std::string> key = field == GroupField::ColorIdentity
            ? r.color_identity
            : std::optional<std::string>(r.strategy);

        auto it = std::ranges::find(buckets, key, &Bucket::key);
        if (it == buckets.end()) {
            buckets.push_back({.key = key});
            it = std::prev(buckets.end());
        }

        auto& b = *it;
        b.row.meta_share_current += r.meta_share_current;
        b.row.sample_size_current += r.sample_size_current;
        add_optional(b.row.meta_share_previous, r.meta_share_previous);
        add_optional(b.row.sample_size_previous, r.sample_size_previous);
        add_optional(b.row.match_count_current, r.match_count_current);
        add_optional(b.row.match_count_previous, r.match_count_previous);

        if (r.win_rate_current) {
            b.win_rate_current_sum += *r.win_rate_current;
            b.win_rate_current_n++;
        }
        if (r.win_rate_previous) {
            b.win_rate_previous_sum += *r.win_rate_previous;
            b.win_rate_previous_n++;
        }
    }

    std::vector<RankingRow> result;
    result.reserve(buckets.size());

    for (auto& b : buckets) {
        auto row = std::move(b.row);
        row.main_title = std::string(grouped_title);
        row.grouped = true;

        // The grouping key is written into both categorical fields.
        row.color_identity = b.key;
        row.strategy = b.key.value_or("");

        if (b.win_rate_current_n > 0) {
            row.win_rate_current = b.win_rate_current_sum / b.win_rate_current_n;
        }
        if (b.win_rate_previous_n > 0) {
            row.win_rate_previous = b.win_rate_previous_sum / b.win_rate_previous_n;
        }

        result.push_back(std::move(row));
    }

    return result;
}

void sort_rankings(std::vector<RankingRow>& rows) {
    std::ranges::sort(rows, [](const RankingRow& a, const RankingRow& b) {
        if (a.meta_share_current != b.meta_share_current) {
            return a.meta_share_current > b.meta_share_current;
        }
        if (a.main_title != b.main_title) return a.main_title < b.main_title;
        return a.strategy < b.strategy;
    });
}

std::expected<GroupField, AnalyticsError> parse_group_field(std::string_view name) {
    if (name == "color_identity") return GroupField::ColorIdentity;
    if (name == "strategy") return GroupField::Strategy;
    return std::unexpected(AnalyticsError{
        ErrorKind::Validation,
        "unknown group_by field '" + std::string(name) +
            "' (expected color_identity or strategy)",
    });
}

} // namespace metagame

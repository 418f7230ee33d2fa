#include <gtest/gtest.h>
#include "metagame/rankings.hpp"
#include <algorithm>

using namespace metagame;

namespace {

ShareResult make_share(ArchetypeId id, const std::string& title, int sample, double share,
                       std::optional<std::string> colors = std::nullopt,
                       const std::string& strategy = "midrange") {
    return {
        .archetype_id = id,
        .main_title = title,
        .color_identity = std::move(colors),
        .strategy = strategy,
        .sample_size = sample,
        .meta_share = share,
    };
}

WinRateResult make_wr(ArchetypeId id, int wins, int count, std::optional<double> rate) {
    return {
        .archetype_id = id,
        .main_title = "",
        .wins = wins,
        .match_count = count,
        .win_rate = rate,
    };
}

RankingRow make_row(ArchetypeId id, std::optional<std::string> colors, const std::string& strategy,
                    double share, int sample) {
    RankingRow r;
    r.archetype_id = id;
    r.main_title = "Archetype " + std::to_string(id);
    r.color_identity = std::move(colors);
    r.strategy = strategy;
    r.meta_share_current = share;
    r.sample_size_current = sample;
    return r;
}

const RankingRow* find_row(const std::vector<RankingRow>& rows, ArchetypeId id) {
    auto it = std::ranges::find_if(rows, [&](const RankingRow& r) { return r.archetype_id == id; });
    return it == rows.end() ? nullptr : &*it;
}

} // namespace

TEST(MergePeriods, CurrentPeriodIsTheBase) {
    auto rows = merge_periods(
        {make_share(1, "Esper", 3, 75.0), make_share(2, "Domain", 1, 25.0)},
        {make_share(1, "Esper", 2, 50.0), make_share(9, "Retired", 2, 50.0)},
        {}, {});

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(find_row(rows, 9), nullptr);
}

TEST(MergePeriods, MissingSidesAreAbsentNotZero) {
    auto rows = merge_periods({make_share(1, "Esper", 3, 100.0)}, {}, {}, {});

    ASSERT_EQ(rows.size(), 1u);
    auto& r = rows[0];
    EXPECT_FALSE(r.meta_share_previous.has_value());
    EXPECT_FALSE(r.sample_size_previous.has_value());
    EXPECT_FALSE(r.win_rate_current.has_value());
    EXPECT_FALSE(r.match_count_current.has_value());
    EXPECT_FALSE(r.win_rate_previous.has_value());
    EXPECT_FALSE(r.match_count_previous.has_value());
    EXPECT_FALSE(r.meta_share_delta().has_value());
}

TEST(MergePeriods, JoinsDoNotClobberEachOther) {
    auto rows = merge_periods(
        {make_share(1, "Esper", 3, 60.0), make_share(2, "Domain", 2, 40.0)},
        {make_share(1, "Esper", 1, 50.0)},
        {make_wr(1, 2, 4, 50.0), make_wr(2, 1, 2, std::nullopt)},
        {make_wr(2, 3, 3, 100.0)});

    auto* esper = find_row(rows, 1);
    ASSERT_NE(esper, nullptr);
    EXPECT_DOUBLE_EQ(*esper->meta_share_previous, 50.0);
    EXPECT_EQ(*esper->sample_size_previous, 1);
    EXPECT_DOUBLE_EQ(*esper->win_rate_current, 50.0);
    EXPECT_EQ(*esper->match_count_current, 4);
    EXPECT_FALSE(esper->win_rate_previous.has_value());
    EXPECT_FALSE(esper->match_count_previous.has_value());
    EXPECT_DOUBLE_EQ(*esper->meta_share_delta(), 10.0);

    auto* domain = find_row(rows, 2);
    ASSERT_NE(domain, nullptr);
    EXPECT_FALSE(domain->meta_share_previous.has_value());
    EXPECT_FALSE(domain->win_rate_current.has_value());
    EXPECT_EQ(*domain->match_count_current, 2);
    EXPECT_DOUBLE_EQ(*domain->win_rate_previous, 100.0);
    EXPECT_EQ(*domain->match_count_previous, 3);
}

TEST(Filter, ColorIdentityExactMatch) {
    std::vector<RankingRow> rows = {
        make_row(1, "esper", "midrange", 40.0, 4),
        make_row(2, "Esper", "control", 30.0, 3),
        make_row(3, std::nullopt, "aggro", 30.0, 3),
    };

    auto filtered = filter_by_color_identity(rows, "esper");
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered[0].archetype_id, 1);
}

TEST(Filter, Strategy) {
    std::vector<RankingRow> rows = {
        make_row(1, "esper", "midrange", 40.0, 4),
        make_row(2, "boros", "aggro", 30.0, 3),
        make_row(3, "mono-red", "aggro", 30.0, 3),
    };

    auto filtered = filter_by_strategy(rows, "aggro");
    EXPECT_EQ(filtered.size(), 2u);
    for (auto& r : filtered) EXPECT_EQ(r.strategy, "aggro");
}

TEST(Group, CollapsesByColorIdentity) {
    std::vector<RankingRow> rows = {
        make_row(1, "A", "midrange", 50.0, 5),
        make_row(2, "A", "control", 30.0, 3),
        make_row(3, "B", "aggro", 20.0, 2),
    };

    auto grouped = group_rankings(rows, GroupField::ColorIdentity);
    ASSERT_EQ(grouped.size(), 2u);

    int before = 0, after = 0;
    for (auto& r : rows) before += r.sample_size_current;
    for (auto& r : grouped) after += r.sample_size_current;
    EXPECT_EQ(before, after);

    auto it = std::ranges::find(grouped, std::optional<std::string>("A"), &RankingRow::color_identity);
    ASSERT_NE(it, grouped.end());
    EXPECT_DOUBLE_EQ(it->meta_share_current, 80.0);
    EXPECT_EQ(it->sample_size_current, 8);
    EXPECT_EQ(it->main_title, grouped_title);
    EXPECT_TRUE(it->grouped);
    EXPECT_FALSE(it->archetype_id.has_value());
    // Grouping key is copied into the strategy slot
    EXPECT_EQ(it->strategy, "A");
}

TEST(Group, ByStrategyOverwritesColorIdentity) {
    std::vector<RankingRow> rows = {
        make_row(1, "esper", "control", 50.0, 5),
        make_row(2, "azorius", "control", 30.0, 3),
    };

    auto grouped = group_rankings(rows, GroupField::Strategy);
    ASSERT_EQ(grouped.size(), 1u);
    EXPECT_EQ(grouped[0].strategy, "control");
    EXPECT_EQ(grouped[0].color_identity, "control");
}

TEST(Group, WinRateIsUnweightedMeanOfPresentValues) {
    auto a = make_row(1, "A", "aggro", 40.0, 4);
    a.win_rate_current = 60.0;
    a.match_count_current = 100;
    auto b = make_row(2, "A", "aggro", 30.0, 3);
    b.win_rate_current = 40.0;
    b.match_count_current = 4;
    auto c = make_row(3, "A", "aggro", 30.0, 3);
    c.match_count_current = 2; // suppressed

    auto grouped = group_rankings({a, b, c}, GroupField::Strategy);
    ASSERT_EQ(grouped.size(), 1u);
    EXPECT_DOUBLE_EQ(*grouped[0].win_rate_current, 50.0);
    EXPECT_EQ(*grouped[0].match_count_current, 106);
    EXPECT_FALSE(grouped[0].win_rate_previous.has_value());
    EXPECT_FALSE(grouped[0].meta_share_previous.has_value());
}

TEST(Group, PreviousSharesSumOverPresentMembers) {
    auto a = make_row(1, "A", "aggro", 40.0, 4);
    a.meta_share_previous = 25.0;
    a.sample_size_previous = 5;
    auto b = make_row(2, "A", "aggro", 60.0, 6);

    auto grouped = group_rankings({a, b}, GroupField::ColorIdentity);
    ASSERT_EQ(grouped.size(), 1u);
    EXPECT_DOUBLE_EQ(*grouped[0].meta_share_previous, 25.0);
    EXPECT_EQ(*grouped[0].sample_size_previous, 5);
    EXPECT_DOUBLE_EQ(grouped[0].meta_share_current, 100.0);
}

TEST(Group, MissingColorIdentityFormsOneBucket) {
    std::vector<RankingRow> rows = {
        make_row(1, std::nullopt, "aggro", 50.0, 5),
        make_row(2, std::nullopt, "ramp", 50.0, 5),
    };

    auto grouped = group_rankings(rows, GroupField::ColorIdentity);
    ASSERT_EQ(grouped.size(), 1u);
    EXPECT_FALSE(grouped[0].color_identity.has_value());
    EXPECT_EQ(grouped[0].sample_size_current, 10);
}

TEST(Sort, MetaShareDescending) {
    std::vector<RankingRow> rows = {
        make_row(1, "A", "aggro", 10.0, 1),
        make_row(2, "B", "aggro", 60.0, 6),
        make_row(3, "C", "aggro", 30.0, 3),
    };

    sort_rankings(rows);
    EXPECT_EQ(rows[0].archetype_id, 2);
    EXPECT_EQ(rows[1].archetype_id, 3);
    EXPECT_EQ(rows[2].archetype_id, 1);
}

TEST(GroupField, ParsesKnownNames) {
    EXPECT_EQ(*parse_group_field("strategy"), GroupField::Strategy);
    EXPECT_EQ(*parse_group_field("color_identity"), GroupField::ColorIdentity);

    auto bad = parse_group_field("archetype");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().kind, ErrorKind::Validation);
}

#include <gtest/gtest.h>
#include "metagame/query.hpp"

using namespace metagame;

namespace {

RankingsQuery valid_query() {
    return {.format = "Modern"};
}

} // namespace

TEST(RankingsQuery, DefaultsAreValid) {
    auto q = normalize_rankings_query(valid_query());
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->current_days, 14);
    EXPECT_EQ(q->previous_days, 14);
}

TEST(RankingsQuery, FormatIsRequired) {
    auto q = normalize_rankings_query(RankingsQuery{});
    ASSERT_FALSE(q.has_value());
    EXPECT_EQ(q.error().kind, ErrorKind::Validation);
    EXPECT_NE(q.error().message.find("format"), std::string::npos);
}

TEST(RankingsQuery, DayBounds) {
    auto q = valid_query();
    q.current_days = 365;
    q.previous_days = 1;
    EXPECT_TRUE(normalize_rankings_query(q).has_value());

    q.current_days = 366;
    auto too_long = normalize_rankings_query(q);
    ASSERT_FALSE(too_long.has_value());
    EXPECT_NE(too_long.error().message.find("current_days"), std::string::npos);

    q.current_days = 14;
    q.previous_days = 0;
    auto too_short = normalize_rankings_query(q);
    ASSERT_FALSE(too_short.has_value());
    EXPECT_NE(too_short.error().message.find("previous_days"), std::string::npos);
}

TEST(RankingsQuery, OffsetsReplacePreviousDays) {
    auto q = valid_query();
    q.previous_days = 0; // ignored when offsets are given
    q.previous_offsets = PreviousOffsets{.start_days_ago = 60, .end_days_ago = 0};
    EXPECT_TRUE(normalize_rankings_query(q).has_value());

    q.previous_offsets = PreviousOffsets{.start_days_ago = 0, .end_days_ago = 0};
    EXPECT_FALSE(normalize_rankings_query(q).has_value());

    q.previous_offsets = PreviousOffsets{.start_days_ago = 30, .end_days_ago = -1};
    EXPECT_FALSE(normalize_rankings_query(q).has_value());
}

TEST(RankingsQuery, StrategyIsLowerCased) {
    auto q = valid_query();
    q.strategy = "Control";
    auto normalized = normalize_rankings_query(q);
    ASSERT_TRUE(normalized.has_value());
    EXPECT_EQ(normalized->strategy, "control");
}

TEST(RankingsQuery, UnknownStrategyRejected) {
    auto q = valid_query();
    q.strategy = "tempo";
    auto normalized = normalize_rankings_query(q);
    ASSERT_FALSE(normalized.has_value());
    EXPECT_EQ(normalized.error().kind, ErrorKind::Validation);
    EXPECT_NE(normalized.error().message.find("tempo"), std::string::npos);
}

TEST(RankingsQuery, GroupByValidated) {
    auto q = valid_query();
    q.group_by = "Color_Identity";
    auto normalized = normalize_rankings_query(q);
    ASSERT_TRUE(normalized.has_value());
    EXPECT_EQ(normalized->group_by, "color_identity");

    q.group_by = "format";
    EXPECT_FALSE(normalize_rankings_query(q).has_value());
}

TEST(RankingsQuery, ColorIdentityPassesThrough) {
    auto q = valid_query();
    q.color_identity = "Esper";
    auto normalized = normalize_rankings_query(q);
    ASSERT_TRUE(normalized.has_value());
    EXPECT_EQ(normalized->color_identity, "Esper");
}

TEST(MatchupQuery, Bounds) {
    EXPECT_TRUE(normalize_matchup_query({.format = "Pioneer", .days = 30}).has_value());
    EXPECT_FALSE(normalize_matchup_query({.format = "Pioneer", .days = 0}).has_value());
    EXPECT_FALSE(normalize_matchup_query({.format = "Pioneer", .days = 400}).has_value());
    EXPECT_FALSE(normalize_matchup_query({.format = "", .days = 14}).has_value());
}

TEST(RankingsQuery, MinMatchesOverrideValidated) {
    auto q = valid_query();
    q.min_matches = 5;
    EXPECT_TRUE(normalize_rankings_query(q).has_value());

    q.min_matches = 0;
    EXPECT_FALSE(normalize_rankings_query(q).has_value());

    EXPECT_FALSE(normalize_matchup_query({.format = "Pioneer", .days = 14, .min_matches = -1}).has_value());
}

TEST(MinMatches, MustBePositive) {
    EXPECT_EQ(validate_min_matches(1), 1);
    EXPECT_EQ(validate_min_matches(5), 5);

    auto zero = validate_min_matches(0);
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().kind, ErrorKind::Validation);
}

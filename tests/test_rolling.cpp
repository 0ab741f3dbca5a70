#include <gtest/gtest.h>
#include "matchfeat/rolling.hpp"
#include "matchfeat/table.hpp"
#include "matchfeat/temporal_grouper.hpp"
#include <cmath>
#include <stdexcept>

using namespace matchfeat;

namespace {

RowTable make_series(const std::vector<std::string>& values, const std::string& team = "A") {
    RowTable t;
    t.columns = {"team", "pts"};
    for (auto& v : values) {
        Record r;
        r.set("team", team);
        if (!v.empty()) r.set("pts", v);
        t.rows.push_back(std::move(r));
    }
    return t;
}

GroupedSeries group(const RowTable& t) {
    return *group_series(t, {.group_column = "team"});
}

const FeatureColumn& column(const std::vector<FeatureColumn>& cols, const std::string& name) {
    for (auto& c : cols) {
        if (c.name == name) return c;
    }
    throw std::runtime_error("no column " + name);
}

} // namespace

TEST(Rolling, MeanOverShrinkingThenFullWindow) {
    auto t = make_series({"1", "2", "3", "4", "5"});
    auto out = rolling(t, group(t), {.column = "pts", .window = 3});
    ASSERT_TRUE(out);
    ASSERT_EQ(out->size(), 1u);

    auto& col = out->front();
    EXPECT_EQ(col.name, "pts_rolling_mean_3");
    std::vector<double> expected{1.0, 1.5, 2.0, 3.0, 4.0};
    for (std::size_t i = 0; i < expected.size(); ++i) {
        ASSERT_TRUE(col.values[i].has_value());
        EXPECT_DOUBLE_EQ(*col.values[i], expected[i]);
    }
}

TEST(Rolling, SumMinMaxStd) {
    auto t = make_series({"4", "2", "6"});
    auto s = group(t);

    auto sum = rolling(t, s, {.column = "pts", .window = 2, .stat = RollingStat::Sum});
    auto min = rolling(t, s, {.column = "pts", .window = 2, .stat = RollingStat::Min});
    auto max = rolling(t, s, {.column = "pts", .window = 2, .stat = RollingStat::Max});
    auto sd = rolling(t, s, {.column = "pts", .window = 3, .stat = RollingStat::Std});
    ASSERT_TRUE(sum && min && max && sd);

    EXPECT_DOUBLE_EQ(*sum->front().values[2], 8.0);
    EXPECT_DOUBLE_EQ(*min->front().values[1], 2.0);
    EXPECT_DOUBLE_EQ(*max->front().values[2], 6.0);
    EXPECT_DOUBLE_EQ(*sd->front().values[0], 0.0);
    EXPECT_NEAR(*sd->front().values[2], std::sqrt(8.0 / 3.0), 1e-12);
    EXPECT_EQ(sd->front().name, "pts_rolling_std_3");
}

TEST(Rolling, SkipsMissingValues) {
    auto t = make_series({"", "2", "", "4"});
    auto out = rolling(t, group(t), {.column = "pts", .window = 2});
    ASSERT_TRUE(out);
    auto& v = out->front().values;
    EXPECT_FALSE(v[0].has_value());
    EXPECT_DOUBLE_EQ(*v[1], 2.0);
    EXPECT_DOUBLE_EQ(*v[2], 2.0);
    EXPECT_DOUBLE_EQ(*v[3], 4.0);
}

TEST(Rolling, GroupsDoNotMix) {
    RowTable t;
    t.columns = {"team", "pts"};
    std::vector<std::pair<std::string, std::string>> games{
        {"A", "10"}, {"B", "100"}, {"A", "20"}, {"B", "200"}};
    for (auto& [team, pts] : games) {
        Record r;
        r.set("team", team);
        r.set("pts", pts);
        t.rows.push_back(r);
    }

    auto out = rolling(t, group(t), {.column = "pts", .window = 5});
    ASSERT_TRUE(out);
    auto& v = out->front().values;
    EXPECT_DOUBLE_EQ(*v[0], 10.0);
    EXPECT_DOUBLE_EQ(*v[1], 100.0);
    EXPECT_DOUBLE_EQ(*v[2], 15.0);
    EXPECT_DOUBLE_EQ(*v[3], 150.0);
}

TEST(Rolling, TruncatingFutureRowsLeavesPastUnchanged) {
    auto full = make_series({"3", "9", "4", "7", "1", "8"});
    auto prefix = take_rows(full, {0, 1, 2, 3});

    RollingOptions opts{.column = "pts", .window = 3, .stat = RollingStat::Std};
    auto a = rolling(full, group(full), opts);
    auto b = rolling(prefix, group(prefix), opts);
    ASSERT_TRUE(a && b);

    for (std::size_t i = 0; i < prefix.size(); ++i) {
        EXPECT_EQ(a->front().values[i], b->front().values[i]) << "row " << i;
    }
}

TEST(Rolling, FlagsPartialWindows) {
    auto t = make_series({"1", "2", "3"});
    auto out = rolling(t, group(t), {.column = "pts", .window = 2, .flag_partial = true});
    ASSERT_TRUE(out);
    ASSERT_EQ(out->size(), 2u);

    auto& flag = column(*out, "pts_rolling_mean_2_partial");
    EXPECT_DOUBLE_EQ(*flag.values[0], 1.0);
    EXPECT_DOUBLE_EQ(*flag.values[1], 0.0);
    EXPECT_DOUBLE_EQ(*flag.values[2], 0.0);
}

TEST(Rolling, CustomOutputName) {
    auto t = make_series({"1"});
    auto out = rolling(t, group(t), {.column = "pts", .window = 2, .output_name = "form"});
    ASSERT_TRUE(out);
    EXPECT_EQ(out->front().name, "form");
}

TEST(Rolling, RejectsNonPositiveWindow) {
    auto t = make_series({"1"});
    auto out = rolling(t, group(t), {.column = "pts", .window = 0});
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().kind, ErrorKind::InvalidArgument);
}

TEST(Rolling, UnknownColumn) {
    auto t = make_series({"1"});
    auto out = rolling(t, group(t), {.column = "goals", .window = 2});
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().kind, ErrorKind::UnknownColumn);
}

TEST(Rolling, RejectsSeriesFromAnotherTable) {
    auto t = make_series({"1", "2"});
    auto other = make_series({"1"});
    auto out = rolling(t, group(other), {.column = "pts", .window = 2});
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().kind, ErrorKind::InvalidArgument);
}

TEST(RollingStat, ParsesNames) {
    EXPECT_EQ(parse_rolling_stat("mean"), RollingStat::Mean);
    EXPECT_EQ(parse_rolling_stat("avg"), RollingStat::Mean);
    EXPECT_EQ(parse_rolling_stat("std"), RollingStat::Std);
    EXPECT_FALSE(parse_rolling_stat("median").has_value());
}

TEST(Momentum, WinShareOverLastGames) {
    RowTable t;
    t.columns = {"team", "result"};
    for (auto res : {"W", "L", "W", "W"}) {
        Record r;
        r.set("team", "A");
        r.set("result", res);
        t.rows.push_back(r);
    }

    auto out = momentum(t, group(t), {.result_column = "result", .window = 2});
    ASSERT_TRUE(out);
    auto& col = out->front();
    EXPECT_EQ(col.name, "momentum_score");
    EXPECT_DOUBLE_EQ(*col.values[0], 1.0);
    EXPECT_DOUBLE_EQ(*col.values[1], 0.5);
    EXPECT_DOUBLE_EQ(*col.values[2], 0.5);
    EXPECT_DOUBLE_EQ(*col.values[3], 1.0);
}

TEST(Momentum, TruncatingFutureRowsLeavesPastUnchanged) {
    RowTable full;
    full.columns = {"team", "result"};
    std::vector<std::pair<std::string, std::string>> games{
        {"A", "W"}, {"B", "L"}, {"A", "L"}, {"A", "W"}, {"B", "W"}, {"A", "W"}, {"B", "L"}};
    for (auto& [team, result] : games) {
        Record r;
        r.set("team", team);
        r.set("result", result);
        full.rows.push_back(r);
    }
    auto prefix = take_rows(full, {0, 1, 2, 3});

    MomentumOptions opts{.result_column = "result", .window = 3};
    auto a = momentum(full, group(full), opts);
    auto b = momentum(prefix, group(prefix), opts);
    ASSERT_TRUE(a && b);

    for (std::size_t i = 0; i < prefix.size(); ++i) {
        EXPECT_EQ(a->front().values[i], b->front().values[i]) << "row " << i;
    }
}

TEST(Cumulative, RunningStatsSkipMissing) {
    auto t = make_series({"4", "", "6", "2"});
    auto s = group(t);

    auto sum = cumulative(t, s, {.column = "pts"});
    auto mean = cumulative(t, s, {.column = "pts", .stat = RollingStat::Mean});
    auto max = cumulative(t, s, {.column = "pts", .stat = RollingStat::Max});
    auto min = cumulative(t, s, {.column = "pts", .stat = RollingStat::Min});
    ASSERT_TRUE(sum && mean && max && min);

    EXPECT_EQ(sum->front().name, "pts_cumulative_sum");
    EXPECT_EQ(max->front().name, "pts_cumulative_max");

    auto values = [](const FeatureColumn& col) {
        std::vector<double> out;
        for (auto& v : col.values) out.push_back(v.value_or(-1.0));
        return out;
    };
    EXPECT_EQ(values(sum->front()), (std::vector<double>{4, 4, 10, 12}));
    EXPECT_EQ(values(mean->front()), (std::vector<double>{4, 4, 5, 4}));
    EXPECT_EQ(values(max->front()), (std::vector<double>{4, 4, 6, 6}));
    EXPECT_EQ(values(min->front()), (std::vector<double>{4, 4, 4, 2}));
}

TEST(Cumulative, UnsetBeforeFirstValueAndPerGroup) {
    RowTable t;
    t.columns = {"team", "pts"};
    std::vector<std::pair<std::string, std::string>> games{
        {"A", ""}, {"B", "100"}, {"A", "1"}, {"B", "200"}};
    for (auto& [team, pts] : games) {
        Record r;
        r.set("team", team);
        if (!pts.empty()) r.set("pts", pts);
        t.rows.push_back(r);
    }

    auto out = cumulative(t, group(t), {.column = "pts", .output_name = "season_pts"});
    ASSERT_TRUE(out);
    auto& v = out->front().values;
    EXPECT_EQ(out->front().name, "season_pts");
    EXPECT_FALSE(v[0].has_value());
    EXPECT_DOUBLE_EQ(*v[1], 100.0);
    EXPECT_DOUBLE_EQ(*v[2], 1.0);
    EXPECT_DOUBLE_EQ(*v[3], 300.0);
}

TEST(Cumulative, TruncatingFutureRowsLeavesPastUnchanged) {
    auto full = make_series({"3", "9", "4", "7", "1"});
    auto prefix = take_rows(full, {0, 1, 2});

    CumulativeOptions opts{.column = "pts", .stat = RollingStat::Std};
    auto a = cumulative(full, group(full), opts);
    auto b = cumulative(prefix, group(prefix), opts);
    ASSERT_TRUE(a && b);

    for (std::size_t i = 0; i < prefix.size(); ++i) {
        EXPECT_EQ(a->front().values[i], b->front().values[i]) << "row " << i;
    }
}

TEST(Rank, SeasonRankSharesTies) {
    auto t = make_series({"10", "30", "20", "30", ""});
    auto s = group(t);

    auto desc = rank_within_group(t, s, {.column = "pts"});
    auto asc = rank_within_group(t, s, {.column = "pts", .ascending = true});
    ASSERT_TRUE(desc && asc);
    EXPECT_EQ(desc->front().name, "pts_rank");

    auto& d = desc->front().values;
    EXPECT_DOUBLE_EQ(*d[0], 4.0);
    EXPECT_DOUBLE_EQ(*d[1], 1.0);
    EXPECT_DOUBLE_EQ(*d[2], 3.0);
    EXPECT_DOUBLE_EQ(*d[3], 1.0);
    EXPECT_FALSE(d[4].has_value());

    auto& a = asc->front().values;
    EXPECT_DOUBLE_EQ(*a[0], 1.0);
    EXPECT_DOUBLE_EQ(*a[1], 3.0);
    EXPECT_DOUBLE_EQ(*a[2], 2.0);
    EXPECT_DOUBLE_EQ(*a[3], 3.0);
}

TEST(Rank, AsOfRowRanksAgainstEarlierGames) {
    RowTable t;
    t.columns = {"team", "date", "pts"};
    std::vector<std::vector<std::string>> games{
        {"A", "2024-01-01", "10"},
        {"A", "2024-01-02", "30"},
        {"A", "2024-01-03", "20"},
        {"A", "2024-01-03", "25"},
        {"A", "2024-01-04", "30"},
    };
    for (auto& g : games) {
        Record r;
        r.set("team", g[0]);
        r.set("date", g[1]);
        r.set("pts", g[2]);
        t.rows.push_back(r);
    }
    auto s = *group_series(t, {.group_column = "team", .timestamp_column = "date"});

    auto out = rank_within_group(t, s, {.column = "pts", .scope = AggregateScope::AsOfRow});
    ASSERT_TRUE(out);
    auto& v = out->front().values;
    EXPECT_DOUBLE_EQ(*v[0], 1.0);
    EXPECT_DOUBLE_EQ(*v[1], 1.0);
    // Same-day games rank against each other.
    EXPECT_DOUBLE_EQ(*v[2], 3.0);
    EXPECT_DOUBLE_EQ(*v[3], 2.0);
    EXPECT_DOUBLE_EQ(*v[4], 1.0);
}

TEST(Rank, RejectsStrictlyPastScope) {
    auto t = make_series({"1", "2"});
    auto out = rank_within_group(t, group(t), {.column = "pts",
                                               .scope = AggregateScope::StrictlyPast});
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().kind, ErrorKind::InvalidArgument);
}

#include <gtest/gtest.h>
#include "matchfeat/config.hpp"
#include "matchfeat/logging.hpp"

using namespace matchfeat;
using nlohmann::json;

TEST(Config, ParsesFullConfig) {
    auto j = json::parse(R"({
        "group_column": "team",
        "timestamp_column": "date",
        "rates": [{"numerator": "GF", "denominator": "GP", "output": "gf_per_game"}],
        "rolling": [
            {"column": "pts", "window": 5},
            {"column": "pts", "window": 3, "stat": "std", "flag_partial": true}
        ],
        "ewma": {"column": "pts", "span": 4},
        "lags": [{"column": "pts", "periods": [1, 2]}],
        "streaks": {"result_column": "result"},
        "rest_days": {"first_game_days": 5},
        "clutch": {"goal_diff_column": "diff", "result_column": "result", "scope": "strictly_past"},
        "time_series_split": {"timestamp_column": "date", "n_splits": 4, "test_fraction": 0.1},
        "stratified_split": {"target_column": "result", "seed": 7}
    })");

    auto config = parse_config(j);
    ASSERT_TRUE(config) << config.error().message;

    EXPECT_EQ(config->grouping.group_column, "team");
    EXPECT_EQ(config->grouping.timestamp_column, "date");
    EXPECT_FALSE(config->grouping.sequence_column.has_value());

    ASSERT_EQ(config->rates.size(), 1u);
    EXPECT_EQ(config->rates[0].output_name, "gf_per_game");

    ASSERT_EQ(config->rolling.size(), 2u);
    EXPECT_EQ(config->rolling[0].window, 5);
    EXPECT_EQ(config->rolling[0].stat, RollingStat::Mean);
    EXPECT_EQ(config->rolling[1].stat, RollingStat::Std);
    EXPECT_TRUE(config->rolling[1].flag_partial);

    ASSERT_EQ(config->ewma.size(), 1u);
    EXPECT_EQ(config->ewma[0].span, 4.0);
    EXPECT_FALSE(config->ewma[0].alpha.has_value());

    ASSERT_EQ(config->lags.size(), 1u);
    EXPECT_EQ(config->lags[0].periods, (std::vector<int>{1, 2}));

    ASSERT_TRUE(config->streaks);
    ASSERT_TRUE(config->rest_days);
    EXPECT_EQ(config->rest_days->first_game_days, 5);
    EXPECT_EQ(config->rest_days->back_to_back_max_days, 1);

    ASSERT_TRUE(config->clutch);
    EXPECT_EQ(config->clutch->scope, AggregateScope::StrictlyPast);
    EXPECT_DOUBLE_EQ(config->clutch->close_margin, 1.0);

    ASSERT_TRUE(config->time_series_split);
    EXPECT_EQ(config->time_series_split->n_splits, 4);
    EXPECT_DOUBLE_EQ(config->time_series_split->test_fraction, 0.1);

    ASSERT_TRUE(config->stratified_split);
    EXPECT_EQ(config->stratified_split->seed, 7u);
    EXPECT_DOUBLE_EQ(config->stratified_split->test_fraction, 0.2);

    EXPECT_FALSE(config->pythagorean);
    EXPECT_FALSE(config->momentum);
}

TEST(Config, EmptyObjectEnablesNothing) {
    auto config = parse_config(json::object());
    ASSERT_TRUE(config);
    EXPECT_TRUE(plan_steps(*config).empty());
    EXPECT_FALSE(config->grouping.group_column.has_value());
}

TEST(Config, StrengthDefaultsUseStandingsColumns) {
    auto config = parse_config(json::parse(R"({"pythagorean": {}, "strength_index": {}})"));
    ASSERT_TRUE(config);
    ASSERT_TRUE(config->pythagorean);
    EXPECT_EQ(config->pythagorean->goals_for, "GF");
    EXPECT_EQ(config->pythagorean->wins, "W");
    ASSERT_TRUE(config->strength_index);
    EXPECT_EQ(config->strength_index->goal_diff, "DIFF");
}

TEST(Config, CumulativeAndRank) {
    auto config = parse_config(json::parse(R"({
        "cumulative": {"column": "pts", "stat": "max"},
        "rank": [{"column": "pts", "ascending": true, "scope": "as_of_row"}, {"column": "ga"}]
    })"));
    ASSERT_TRUE(config) << config.error().message;

    ASSERT_EQ(config->cumulative.size(), 1u);
    EXPECT_EQ(config->cumulative[0].stat, RollingStat::Max);
    EXPECT_EQ(cumulative_column_name(config->cumulative[0]), "pts_cumulative_max");

    ASSERT_EQ(config->ranks.size(), 2u);
    EXPECT_TRUE(config->ranks[0].ascending);
    EXPECT_EQ(config->ranks[0].scope, AggregateScope::AsOfRow);
    EXPECT_FALSE(config->ranks[1].ascending);
    EXPECT_EQ(config->ranks[1].scope, AggregateScope::Season);
}

TEST(Config, RejectsNonObject) {
    auto config = parse_config(json::array());
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().kind, ErrorKind::InvalidConfig);
}

TEST(Config, MissingRequiredKey) {
    auto config = parse_config(json::parse(R"({"rolling": [{"window": 3}]})"));
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().kind, ErrorKind::InvalidConfig);
}

TEST(Config, WrongValueType) {
    auto config = parse_config(json::parse(R"({"rolling": {"column": "pts", "window": "ten"}})"));
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().kind, ErrorKind::InvalidConfig);
}

TEST(Config, UnknownScope) {
    auto config = parse_config(json::parse(
        R"({"consistency": {"score_column": "pts", "scope": "forever"}})"));
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().kind, ErrorKind::InvalidConfig);
    EXPECT_NE(config.error().message.find("forever"), std::string::npos);
}

TEST(Config, UnknownRollingStat) {
    auto config = parse_config(json::parse(
        R"({"rolling": {"column": "pts", "stat": "median"}})"));
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().kind, ErrorKind::InvalidConfig);
}

TEST(Config, MissingFile) {
    auto config = load_config("/nonexistent/matchfeat/config.json");
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().kind, ErrorKind::Io);
}

TEST(Logging, ParsesLevels) {
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

TEST(Logging, LoggerHonoursLevel) {
    auto log = make_logger("matchfeat-test", spdlog::level::warn);
    EXPECT_FALSE(log->should_log(spdlog::level::info));
    EXPECT_TRUE(log->should_log(spdlog::level::warn));
}

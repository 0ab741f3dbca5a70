#pragma once

#include "matchfeat/logging.hpp"
#include "matchfeat/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace matchfeat {

std::optional<AggregateScope> parse_scope(std::string_view text);
std::string_view to_string(AggregateScope scope);

// -- Row-level metrics --

struct PythagoreanOptions {
    std::string goals_for = "GF";
    std::string goals_against = "GA";
    std::string games = "GP";
    std::string wins = "W";  // empty: no luck_factor
};

// pythagorean_win_pct = GF^2 / (GF^2 + GA^2) when GF > 0 and GA > 0,
// pythagorean_wins = pct * games, luck_factor = wins - pythagorean_wins.
FeatureResult pythagorean(const RowTable& table, const PythagoreanOptions& options = {},
                          spdlog::logger& log = null_logger());

struct StrengthIndexOptions {
    std::string wins = "W";
    std::string losses = "L";
    std::string goal_diff = "DIFF";
};

// win_rate = W / (W + L), 0.5 with no games played;
// team_strength_index = win_rate * 50 + DIFF * 0.5.
FeatureResult team_strength_index(const RowTable& table,
                                  const StrengthIndexOptions& options = {},
                                  spdlog::logger& log = null_logger());

struct EnhancedStrengthOptions {
    std::string goals_for = "GF";
    std::string goals_against = "GA";
    std::string games = "GP";
    std::string wins = "W";
};

// 0-100 composite: win rate 30%, goal differential per game 20%,
// Pythagorean expectation 30%, goals for per game 10%, goals against per
// game 10% (inverted). Per-game terms are min-max scaled over the table, so
// this is a season-level metric.
FeatureResult enhanced_strength_index(const RowTable& table,
                                      const EnhancedStrengthOptions& options = {},
                                      spdlog::logger& log = null_logger());

// -- Aggregates over the grouped season --
//
// With AggregateScope::Season every row sees the whole season, later games
// included. AsOfRow and StrictlyPast restrict the aggregate to rows whose
// timestamp is at or before (strictly before) the current row's; rows with
// equal timestamps are never split. Cross-group metrics use the table-wide
// time order.

struct ConsistencyOptions {
    std::string score_column;
    AggregateScope scope = AggregateScope::Season;
};

// score_mean, score_std_dev (population), score_cv = std / mean (unset when
// the mean is 0) and consistency_score = 1 - score_cv.
FeatureResult consistency(const RowTable& table, const GroupedSeries& series,
                          const ConsistencyOptions& options,
                          spdlog::logger& log = null_logger());

struct ClutchOptions {
    std::string goal_diff_column;
    std::string result_column;
    double close_margin = 1.0;
    AggregateScope scope = AggregateScope::Season;
};

// Win rate in games decided by at most close_margin; 0.5 without close games.
FeatureResult clutch_factor(const RowTable& table, const GroupedSeries& series,
                            const ClutchOptions& options,
                            spdlog::logger& log = null_logger());

struct ScheduleOptions {
    std::string opponent_wins_column;
    AggregateScope scope = AggregateScope::Season;
};

// Mean opponent win total over the entity's games; 0.5 with none.
FeatureResult strength_of_schedule(const RowTable& table, const GroupedSeries& series,
                                   const ScheduleOptions& options,
                                   spdlog::logger& log = null_logger());

struct HeadToHeadOptions {
    std::string team_column;
    std::string opponent_column;
    std::string result_column;
    AggregateScope scope = AggregateScope::Season;
};

// h2h_win_rate = team's wins against opponent / rows of the unordered pair;
// 0.5 when the pair has no games.
FeatureResult head_to_head(const RowTable& table, const GroupedSeries& series,
                           const HeadToHeadOptions& options,
                           spdlog::logger& log = null_logger());

struct ConferenceOptions {
    std::string conference_column;
    std::string division_column;  // empty: no division_strength
    std::string win_pct_column;
    AggregateScope scope = AggregateScope::Season;
};

// conference_strength and division_strength are mean win percentages;
// adjusted_win_pct = win_pct / conference_strength * 0.5, unset when the
// conference average is 0.
FeatureResult conference_adjustments(const RowTable& table, const GroupedSeries& series,
                                     const ConferenceOptions& options,
                                     spdlog::logger& log = null_logger());

struct HomeAwayOptions {
    std::string location_column;
    std::string result_column;
    AggregateScope scope = AggregateScope::Season;
};

// home_win_rate, away_win_rate (0.5 without such games) and home_away_diff.
FeatureResult home_away_splits(const RowTable& table, const GroupedSeries& series,
                               const HomeAwayOptions& options,
                               spdlog::logger& log = null_logger());

} // namespace matchfeat

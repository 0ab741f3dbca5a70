#pragma once

#include "matchfeat/derived_features.hpp"
#include "matchfeat/ewma.hpp"
#include "matchfeat/lag.hpp"
#include "matchfeat/logging.hpp"
#include "matchfeat/rest_days.hpp"
#include "matchfeat/rolling.hpp"
#include "matchfeat/splitter.hpp"
#include "matchfeat/streak_detector.hpp"
#include "matchfeat/strength_metrics.hpp"
#include "matchfeat/temporal_grouper.hpp"
#include "matchfeat/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace matchfeat {

struct PipelineConfig {
    GroupOptions grouping;

    // Steps run in the order listed here, except that a step reading another
    // step's output column is moved after that step.

    // Row-level derivations.
    std::vector<RateOptions> rates;
    std::vector<InteractionOptions> interactions;
    std::vector<PolynomialOptions> polynomials;
    std::optional<PythagoreanOptions> pythagorean;
    std::optional<StrengthIndexOptions> strength_index;

    // Per-group passes over the time-ordered series.
    std::vector<RollingOptions> rolling;
    std::vector<EwmaOptions> ewma;
    std::vector<LagOptions> lags;
    std::vector<CumulativeOptions> cumulative;
    std::vector<RankOptions> ranks;
    std::optional<MomentumOptions> momentum;
    std::optional<StreakOptions> streaks;
    std::optional<RestDaysOptions> rest_days;

    // Season-level aggregates.
    std::optional<ConsistencyOptions> consistency;
    std::optional<ClutchOptions> clutch;
    std::optional<ScheduleOptions> strength_of_schedule;
    std::optional<HeadToHeadOptions> head_to_head;
    std::optional<ConferenceOptions> conference;
    std::optional<HomeAwayOptions> home_away;
    std::optional<EnhancedStrengthOptions> enhanced_strength;
    std::optional<TimeDecayOptions> time_decay;

    std::optional<TimeSeriesSplitOptions> time_series_split;
    std::optional<StratifiedSplitOptions> stratified_split;
};

struct PipelineStep {
    std::string name;
    std::vector<std::string> requires_columns;
    std::vector<std::string> produces_columns;
};

struct PipelineResult {
    RowTable table;
    GroupedSeries series;
    std::vector<std::string> added_columns;
    std::vector<Fold> folds;
    std::optional<StratifiedSplit> split;
};

// The feature passes the config enables, in execution order: declaration
// order, with every step placed after the steps producing its inputs.
std::vector<PipelineStep> plan_steps(const PipelineConfig& config);

// Checks, without touching any row, that every step's inputs exist when it
// runs and that no step adds a column that is already there.
std::expected<void, FeatureError> validate_pipeline(
    const std::vector<std::string>& input_columns, const PipelineConfig& config);

std::expected<PipelineResult, FeatureError> run_pipeline(
    RowTable table, const PipelineConfig& config, spdlog::logger& log = null_logger());

struct FeatureSummary {
    std::string name;
    std::size_t count = 0;  // rows holding a numeric value
    std::optional<double> mean;
    std::optional<double> min;
    std::optional<double> max;
};

std::vector<FeatureSummary> summarize_features(const RowTable& table,
                                               const std::vector<std::string>& columns);

} // namespace matchfeat

#pragma once

#include "matchfeat/logging.hpp"
#include "matchfeat/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace matchfeat {

enum class RollingStat { Mean, Sum, Min, Max, Std };

std::optional<RollingStat> parse_rolling_stat(std::string_view text);
std::string_view to_string(RollingStat stat);

struct RollingOptions {
    std::string column;
    int window = 10;
    RollingStat stat = RollingStat::Mean;
    std::string output_name;    // default: <column>_rolling_<stat>_<window>
    bool flag_partial = false;  // adds <output_name>_partial (1 while the window shrinks)
};

std::string rolling_column_name(const RollingOptions& options);

// Statistic over rows [max(0, i-window+1) .. i] of each group. Missing or
// non-numeric values are skipped; an empty window leaves the row unset.
// Std is the population standard deviation.
FeatureResult rolling(const RowTable& table, const GroupedSeries& series,
                      const RollingOptions& options,
                      spdlog::logger& log = null_logger());

struct MomentumOptions {
    std::string result_column;
    int window = 10;
    std::string output_name = "momentum_score";
};

// Share of wins over the last `window` games (current game included).
FeatureResult momentum(const RowTable& table, const GroupedSeries& series,
                       const MomentumOptions& options,
                       spdlog::logger& log = null_logger());

struct CumulativeOptions {
    std::string column;
    RollingStat stat = RollingStat::Sum;
    std::string output_name;  // default: <column>_cumulative_<stat>
};

std::string cumulative_column_name(const CumulativeOptions& options);

// Running statistic over rows [0 .. i] of each group, current row included.
// Missing values are skipped; rows before the first value stay unset.
FeatureResult cumulative(const RowTable& table, const GroupedSeries& series,
                         const CumulativeOptions& options,
                         spdlog::logger& log = null_logger());

struct RankOptions {
    std::string column;
    bool ascending = false;  // false: the largest value ranks 1
    AggregateScope scope = AggregateScope::Season;
    std::string output_name;  // default: <column>_rank
};

std::string rank_column_name(const RankOptions& options);

// Rank of each row's value within its group, ties sharing the lowest rank
// (1, 2, 2, 4). AsOfRow ranks against rows up to the current timestamp.
// StrictlyPast is rejected: a rank always includes the row's own value.
FeatureResult rank_within_group(const RowTable& table, const GroupedSeries& series,
                                const RankOptions& options,
                                spdlog::logger& log = null_logger());

} // namespace matchfeat

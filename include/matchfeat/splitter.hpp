#pragma once

#include "matchfeat/logging.hpp"
#include "matchfeat/types.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace matchfeat {

struct TimeSeriesSplitOptions {
    std::string timestamp_column = "date";
    int n_splits = 5;
    double test_fraction = 0.2;
};

// Expanding-window folds over the table sorted by timestamp. With
// test_size = floor(total * test_fraction), fold i (0-based) trains on
// [0, total - test_size * (n_splits - i)) and tests on the next test_size
// rows. Rows with a malformed timestamp take no part in any fold.
// InsufficientData when test_size is 0 or total < test_size * n_splits.
std::expected<std::vector<Fold>, FeatureError> time_series_splits(
    const RowTable& table, const TimeSeriesSplitOptions& options,
    spdlog::logger& log = null_logger());

struct StratifiedSplitOptions {
    std::string target_column;
    double test_fraction = 0.2;
    std::uint32_t seed = 42;
};

// Shuffles each target class with one seeded generator and puts the first
// floor(n * (1 - test_fraction)) rows of every class into train. Rows
// without a target value form their own class.
std::expected<StratifiedSplit, FeatureError> stratified_split(
    const RowTable& table, const StratifiedSplitOptions& options,
    spdlog::logger& log = null_logger());

void to_json(nlohmann::json& j, const Fold& fold);
void to_json(nlohmann::json& j, const StratifiedSplit& split);

} // namespace matchfeat

#include "matchfeat/splitter.hpp"
#include "matchfeat/table.hpp"
#include "matchfeat/temporal_grouper.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <unordered_map>

namespace matchfeat {

namespace {

std::expected<void, FeatureError> check_fraction(double fraction) {
    if (!(fraction > 0.0 && fraction < 1.0)) {
        return std::unexpected(FeatureError{
            ErrorKind::InvalidArgument,
            "test fraction must be in (0, 1), got " + format_number(fraction)});
    }
    return {};
}

// floor(n * fraction) without losing a row to representation error
// (e.g. 20 * 0.8 == 16.000000000000004, 10 * 0.7 == 6.999999999999999).
std::size_t scaled_count(std::size_t n, double fraction) {
    return static_cast<std::size_t>(std::floor(static_cast<double>(n) * fraction + 1e-9));
}

} // namespace

std::expected<std::vector<Fold>, FeatureError> time_series_splits(
    const RowTable& table, const TimeSeriesSplitOptions& options, spdlog::logger& log) {

    if (options.n_splits < 1) {
        return std::unexpected(FeatureError{
            ErrorKind::InvalidArgument,
            "n_splits must be positive, got " + std::to_string(options.n_splits)});
    }
    if (auto ok = check_fraction(options.test_fraction); !ok) return std::unexpected(ok.error());

    log.info("Generating time series CV splits ({} folds)", options.n_splits);

    auto series = group_series(table, {.timestamp_column = options.timestamp_column}, log);
    if (!series) return std::unexpected(series.error());

    std::vector<std::size_t> sorted;
    if (!series->groups.empty()) sorted = series->groups.front().rows;

    std::size_t total = sorted.size();
    std::size_t test_size = scaled_count(total, options.test_fraction);
    std::size_t needed = test_size * static_cast<std::size_t>(options.n_splits);

    if (test_size == 0 || total < needed) {
        return std::unexpected(FeatureError{
            ErrorKind::InsufficientData,
            std::to_string(total) + " rows cannot hold " + std::to_string(options.n_splits) +
                " test windows of " + std::to_string(test_size) + " rows"});
    }

    std::vector<Fold> folds;
    for (int i = 0; i < options.n_splits; ++i) {
        std::size_t train_end = total - test_size * static_cast<std::size_t>(options.n_splits - i);
        std::size_t test_end = train_end + test_size;

        Fold fold{.index = i + 1};
        fold.train.assign(sorted.begin(), sorted.begin() + train_end);
        fold.test.assign(sorted.begin() + train_end, sorted.begin() + test_end);

        if (fold.train.empty()) {
            log.warn("Fold {} has an empty training window", fold.index);
        }
        folds.push_back(std::move(fold));
    }

    log.info("Created {} time series CV splits", folds.size());
    return folds;
}

std::expected<StratifiedSplit, FeatureError> stratified_split(
    const RowTable& table, const StratifiedSplitOptions& options, spdlog::logger& log) {

    if (auto ok = check_fraction(options.test_fraction); !ok) return std::unexpected(ok.error());
    if (auto ok = require_columns(table, {options.target_column}); !ok) {
        return std::unexpected(ok.error());
    }

    log.info("Creating stratified train/test split on '{}'", options.target_column);

    std::vector<std::vector<std::size_t>> classes;
    std::unordered_map<std::string, std::size_t> class_index;
    for (std::size_t i = 0; i < table.size(); ++i) {
        auto label = table.rows[i].text(options.target_column).value_or("");
        auto [it, inserted] = class_index.try_emplace(label, classes.size());
        if (inserted) classes.emplace_back();
        classes[it->second].push_back(i);
    }

    std::mt19937 rng(options.seed);
    StratifiedSplit split;

    for (auto& rows : classes) {
        std::ranges::shuffle(rows, rng);
        std::size_t split_idx = scaled_count(rows.size(), 1.0 - options.test_fraction);
        split.train.insert(split.train.end(), rows.begin(), rows.begin() + split_idx);
        split.test.insert(split.test.end(), rows.begin() + split_idx, rows.end());
    }

    log.info("Train: {}, Test: {}", split.train.size(), split.test.size());
    return split;
}

void to_json(nlohmann::json& j, const Fold& fold) {
    j = nlohmann::json{
        {"fold", fold.index},
        {"train", fold.train},
        {"test", fold.test},
        {"train_size", fold.train_size()},
        {"test_size", fold.test_size()},
    };
}

void to_json(nlohmann::json& j, const StratifiedSplit& split) {
    j = nlohmann::json{
        {"train", split.train},
        {"test", split.test},
        {"train_size", split.train.size()},
        {"test_size", split.test.size()},
    };
}

} // namespace matchfeat

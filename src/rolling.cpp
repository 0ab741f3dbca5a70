#include "matchfeat/rolling.hpp"
#include "matchfeat/strength_metrics.hpp"
#include "matchfeat/table.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace matchfeat {

namespace {

double compute(RollingStat stat, const std::vector<double>& values) {
    switch (stat) {
        case RollingStat::Sum:
            return std::accumulate(values.begin(), values.end(), 0.0);
        case RollingStat::Min:
            return *std::ranges::min_element(values);
        case RollingStat::Max:
            return *std::ranges::max_element(values);
        case RollingStat::Std: {
            double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
            double ss = 0.0;
            for (double v : values) ss += (v - mean) * (v - mean);
            return std::sqrt(ss / values.size());
        }
        case RollingStat::Mean:
            break;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

std::expected<void, FeatureError> check_window(int window) {
    if (window < 1) {
        return std::unexpected(FeatureError{
            ErrorKind::InvalidArgument,
            "window must be positive, got " + std::to_string(window)});
    }
    return {};
}

struct Running {
    std::size_t n = 0;
    double sum = 0.0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double m2 = 0.0;

    void add(double x) {
        min = n == 0 ? x : std::min(min, x);
        max = n == 0 ? x : std::max(max, x);
        ++n;
        sum += x;
        double delta = x - mean;
        mean += delta / static_cast<double>(n);
        m2 += delta * (x - mean);
    }

    double get(RollingStat stat) const {
        switch (stat) {
            case RollingStat::Sum: return sum;
            case RollingStat::Min: return min;
            case RollingStat::Max: return max;
            case RollingStat::Std: return std::sqrt(m2 / static_cast<double>(n));
            case RollingStat::Mean: break;
        }
        return mean;
    }
};

} // namespace

std::optional<RollingStat> parse_rolling_stat(std::string_view text) {
    if (text == "mean" || text == "avg") return RollingStat::Mean;
    if (text == "sum") return RollingStat::Sum;
    if (text == "min") return RollingStat::Min;
    if (text == "max") return RollingStat::Max;
    if (text == "std") return RollingStat::Std;
    return std::nullopt;
}

std::string_view to_string(RollingStat stat) {
    switch (stat) {
        case RollingStat::Mean: return "mean";
        case RollingStat::Sum: return "sum";
        case RollingStat::Min: return "min";
        case RollingStat::Max: return "max";
        case RollingStat::Std: return "std";
    }
    return "mean";
}

std::string rolling_column_name(const RollingOptions& options) {
    if (!options.output_name.empty()) return options.output_name;
    return options.column + "_rolling_" + std::string(to_string(options.stat)) +
           "_" + std::to_string(options.window);
}

FeatureResult rolling(const RowTable& table, const GroupedSeries& series,
                      const RollingOptions& options, spdlog::logger& log) {

    if (auto ok = check_window(options.window); !ok) return std::unexpected(ok.error());
    if (auto ok = require_columns(table, {options.column}); !ok) return std::unexpected(ok.error());
    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());

    log.info("Calculating rolling {} of '{}' (window={})",
             to_string(options.stat), options.column, options.window);

    auto name = rolling_column_name(options);
    auto out = make_column(name, table);
    auto partial = make_column(name + "_partial", table);

    std::size_t window = static_cast<std::size_t>(options.window);
    std::size_t partial_rows = 0;
    std::vector<double> values;

    for (auto& group : series.groups) {
        for (std::size_t i = 0; i < group.size(); ++i) {
            std::size_t start = i + 1 >= window ? i + 1 - window : 0;

            values.clear();
            for (std::size_t j = start; j <= i; ++j) {
                if (auto v = table.rows[group.rows[j]].number(options.column)) {
                    values.push_back(*v);
                }
            }

            auto row = group.rows[i];
            if (!values.empty()) out.values[row] = compute(options.stat, values);

            bool shrunk = i + 1 < window;
            partial.values[row] = shrunk ? 1.0 : 0.0;
            if (shrunk) ++partial_rows;
        }
    }

    if (partial_rows > 0) {
        log.debug("{} rows of '{}' use a partial window", partial_rows, name);
    }

    std::vector<FeatureColumn> result;
    result.push_back(std::move(out));
    if (options.flag_partial) result.push_back(std::move(partial));
    return result;
}

FeatureResult momentum(const RowTable& table, const GroupedSeries& series,
                       const MomentumOptions& options, spdlog::logger& log) {

    if (auto ok = check_window(options.window); !ok) return std::unexpected(ok.error());
    if (auto ok = require_columns(table, {options.result_column}); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());

    log.info("Calculating momentum score (last {} games)", options.window);

    auto out = make_column(options.output_name, table);
    std::size_t window = static_cast<std::size_t>(options.window);

    for (auto& group : series.groups) {
        int wins = 0;
        for (std::size_t i = 0; i < group.size(); ++i) {
            if (outcome(table.rows[group.rows[i]], options.result_column).value_or(false)) {
                ++wins;
            }
            if (i >= window &&
                outcome(table.rows[group.rows[i - window]], options.result_column).value_or(false)) {
                --wins;
            }
            std::size_t count = std::min(i + 1, window);
            out.values[group.rows[i]] = static_cast<double>(wins) / count;
        }
    }

    return std::vector<FeatureColumn>{std::move(out)};
}

std::string cumulative_column_name(const CumulativeOptions& options) {
    if (!options.output_name.empty()) return options.output_name;
    return options.column + "_cumulative_" + std::string(to_string(options.stat));
}

FeatureResult cumulative(const RowTable& table, const GroupedSeries& series,
                         const CumulativeOptions& options, spdlog::logger& log) {

    if (auto ok = require_columns(table, {options.column}); !ok) return std::unexpected(ok.error());
    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());

    log.info("Calculating cumulative {} of '{}'", to_string(options.stat), options.column);

    auto out = make_column(cumulative_column_name(options), table);

    for (auto& group : series.groups) {
        Running acc;
        for (auto row : group.rows) {
            if (auto v = table.rows[row].number(options.column)) acc.add(*v);
            if (acc.n > 0) out.values[row] = acc.get(options.stat);
        }
    }

    return std::vector<FeatureColumn>{std::move(out)};
}

std::string rank_column_name(const RankOptions& options) {
    if (!options.output_name.empty()) return options.output_name;
    return options.column + "_rank";
}

FeatureResult rank_within_group(const RowTable& table, const GroupedSeries& series,
                                const RankOptions& options, spdlog::logger& log) {

    if (options.scope == AggregateScope::StrictlyPast) {
        return std::unexpected(FeatureError{
            ErrorKind::InvalidArgument, "rank does not support the strictly_past scope"});
    }
    if (auto ok = require_columns(table, {options.column}); !ok) return std::unexpected(ok.error());
    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());

    log.info("Ranking '{}' within groups ({}, {})", options.column,
             options.ascending ? "ascending" : "descending", to_string(options.scope));

    auto out = make_column(rank_column_name(options), table);
    auto better = [&](double other, double v) {
        return options.ascending ? other < v : other > v;
    };

    std::vector<std::optional<double>> values;
    for (auto& group : series.groups) {
        values.clear();
        for (auto row : group.rows) values.push_back(table.rows[row].number(options.column));

        for (std::size_t i = 0; i < group.size(); ++i) {
            if (!values[i]) continue;

            std::size_t end = group.size();
            if (options.scope == AggregateScope::AsOfRow) {
                end = i + 1;
                while (end < group.size() && group.order_keys[end] == group.order_keys[i]) ++end;
            }

            int ahead = 0;
            for (std::size_t j = 0; j < end; ++j) {
                if (values[j] && better(*values[j], *values[i])) ++ahead;
            }
            out.values[group.rows[i]] = static_cast<double>(ahead + 1);
        }
    }

    return std::vector<FeatureColumn>{std::move(out)};
}

} // namespace matchfeat

#include "matchfeat/lag.hpp"
#include "matchfeat/table.hpp"
#include <algorithm>

namespace matchfeat {

namespace {

std::vector<int> unique_periods(const std::vector<int>& periods) {
    std::vector<int> out;
    for (int k : periods) {
        if (std::ranges::find(out, k) == out.end()) out.push_back(k);
    }
    return out;
}

} // namespace

std::vector<std::string> lag_column_names(const LagOptions& options) {
    std::vector<std::string> names;
    for (int k : unique_periods(options.periods)) {
        names.push_back(options.column + "_lag" + std::to_string(k));
    }
    return names;
}

FeatureResult lag(const RowTable& table, const GroupedSeries& series,
                  const LagOptions& options, spdlog::logger& log) {

    if (options.periods.empty()) {
        return std::unexpected(FeatureError{
            ErrorKind::InvalidArgument, "lag needs at least one period"});
    }
    for (int k : options.periods) {
        if (k < 1) {
            return std::unexpected(FeatureError{
                ErrorKind::InvalidArgument,
                "lag periods must be positive, got " + std::to_string(k)});
        }
    }
    if (auto ok = require_columns(table, {options.column}); !ok) return std::unexpected(ok.error());
    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());

    auto periods = unique_periods(options.periods);
    log.info("Creating lag features for '{}' ({} periods)", options.column, periods.size());

    std::vector<FeatureColumn> result;
    for (int k : periods) {
        auto out = make_column(options.column + "_lag" + std::to_string(k), table);
        std::size_t offset = static_cast<std::size_t>(k);

        for (auto& group : series.groups) {
            for (std::size_t i = offset; i < group.size(); ++i) {
                out.values[group.rows[i]] = table.rows[group.rows[i - offset]].number(options.column);
            }
        }
        result.push_back(std::move(out));
    }

    return result;
}

} // namespace matchfeat

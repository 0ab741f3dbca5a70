#pragma once

#include "matchfeat/logging.hpp"
#include "matchfeat/types.hpp"
#include <string>
#include <vector>

namespace matchfeat {

struct LagOptions {
    std::string column;
    std::vector<int> periods;
};

std::vector<std::string> lag_column_names(const LagOptions& options);

// <column>_lag<k> holds the value k rows earlier in the same group, unset
// for the first k rows. Non-numeric values lag as unset.
FeatureResult lag(const RowTable& table, const GroupedSeries& series,
                  const LagOptions& options, spdlog::logger& log = null_logger());

} // namespace matchfeat

#pragma once

#include "matchfeat/logging.hpp"
#include "matchfeat/types.hpp"
#include <optional>
#include <string>

namespace matchfeat {

struct EwmaOptions {
    std::string column;
    std::optional<double> alpha;  // exactly one of alpha and span
    std::optional<double> span;   // alpha = 2 / (span + 1)
    std::string output_name;      // default: <column>_ewma_<span> or <column>_ewma_alpha<alpha>
};

std::expected<double, FeatureError> resolve_alpha(const EwmaOptions& options);

std::string ewma_column_name(const EwmaOptions& options);

// e[0] = x[0], e[i] = alpha * x[i] + (1 - alpha) * e[i-1], restarted for
// every group. A missing value carries the previous average forward; rows
// before the first value stay unset.
FeatureResult ewma(const RowTable& table, const GroupedSeries& series,
                   const EwmaOptions& options, spdlog::logger& log = null_logger());

} // namespace matchfeat

#pragma once

#include "matchfeat/logging.hpp"
#include "matchfeat/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace matchfeat {

struct GroupOptions {
    std::optional<std::string> group_column;      // none: one series
    std::optional<std::string> timestamp_column;
    std::optional<std::string> sequence_column;   // used when no timestamp column
};

// Groups rows by entity and orders every group ascending in time, ties kept
// in input order. Rows whose timestamp (or sequence value) cannot be parsed
// are left out of the groups and listed in GroupedSeries::excluded; the table
// itself is not touched.
std::expected<GroupedSeries, FeatureError> group_series(
    const RowTable& table, const GroupOptions& options,
    spdlog::logger& log = null_logger());

struct TimeOrderedRows {
    std::vector<std::size_t> rows;
    std::vector<double> order_keys;  // order key of each entry in rows
};

// Every grouped row across all groups, ordered by (order key, table position).
TimeOrderedRows chronological_order(const GroupedSeries& series);
std::vector<std::size_t> chronological_rows(const GroupedSeries& series);

} // namespace matchfeat

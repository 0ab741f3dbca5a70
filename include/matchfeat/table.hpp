#pragma once

#include "matchfeat/types.hpp"
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matchfeat {

std::optional<double> parse_number(std::string_view text);

// Shortest round-trip text for a double ("3", "0.25", "-1.5").
std::string format_number(double value);

// W/WIN/TRUE/1 -> true, L/LOSS/FALSE/0 -> false, numbers > 0 -> true.
std::optional<bool> outcome(const Record& record, const std::string& column);

std::expected<void, FeatureError> require_columns(
    const RowTable& table, std::initializer_list<std::string_view> names);

std::expected<void, FeatureError> require_series(
    const RowTable& table, const GroupedSeries& series);

FeatureColumn make_column(std::string name, const RowTable& table);

// Appends pass output to the table. Existing columns are never overwritten.
std::expected<void, FeatureError> apply_features(
    RowTable& table, std::vector<FeatureColumn> features);

RowTable take_rows(const RowTable& table, const std::vector<std::size_t>& rows);

} // namespace matchfeat

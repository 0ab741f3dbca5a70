#pragma once

#include "matchfeat/pipeline.hpp"
#include "matchfeat/types.hpp"
#include <string>
#include <vector>

namespace matchfeat {

enum class OutputFormat { Table, Csv };

void display_grouping(const GroupedSeries& series, OutputFormat format);

void display_features(const std::vector<FeatureSummary>& features, OutputFormat format);

// Train/test sizes and the date span each side covers.
void display_folds(const std::vector<Fold>& folds, const RowTable& table,
                   const std::string& timestamp_column, OutputFormat format);

void display_split(const StratifiedSplit& split, const RowTable& table,
                   const std::string& target_column, OutputFormat format);

} // namespace matchfeat

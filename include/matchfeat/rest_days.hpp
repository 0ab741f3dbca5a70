#pragma once

#include "matchfeat/logging.hpp"
#include "matchfeat/types.hpp"
#include <string>

namespace matchfeat {

struct RestDaysOptions {
    int first_game_days = 3;
    int back_to_back_max_days = 1;
};

// rest_days: calendar days since the group's previous game (first_game_days
// for its first game). is_back_to_back: 1 when rest_days <= the threshold.
// Needs a timestamp-ordered series; rows excluded for a malformed timestamp
// stay unset.
FeatureResult rest_days(const RowTable& table, const GroupedSeries& series,
                        const RestDaysOptions& options = {},
                        spdlog::logger& log = null_logger());

struct TimeDecayOptions {
    double decay_rate = 0.05;
    std::string output_name = "time_weight";
};

// exp(-decay_rate * days before the latest game in the table). Season-level:
// every weight depends on the last date present.
FeatureResult time_decay_weights(const RowTable& table, const GroupedSeries& series,
                                 const TimeDecayOptions& options = {},
                                 spdlog::logger& log = null_logger());

} // namespace matchfeat

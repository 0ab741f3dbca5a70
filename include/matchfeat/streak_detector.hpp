#pragma once

#include "matchfeat/logging.hpp"
#include "matchfeat/types.hpp"
#include <string>

namespace matchfeat {

struct StreakOptions {
    std::string result_column;
};

// Emits streak_type (+1 win run, -1 loss run), streak_length (run length
// ending at the row), is_win_streak and is_loss_streak. A row whose result is
// neither a win nor a loss gets type 0 and length 0 and ends the run.
FeatureResult detect_streaks(const RowTable& table, const GroupedSeries& series,
                             const StreakOptions& options,
                             spdlog::logger& log = null_logger());

} // namespace matchfeat

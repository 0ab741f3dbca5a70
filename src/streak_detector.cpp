#include "matchfeat/streak_detector.hpp"
#include "matchfeat/table.hpp"

namespace matchfeat {

FeatureResult detect_streaks(const RowTable& table, const GroupedSeries& series,
                             const StreakOptions& options, spdlog::logger& log) {

    if (auto ok = require_columns(table, {options.result_column}); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());

    log.info("Calculating win/loss streaks from '{}'", options.result_column);

    auto type = make_column("streak_type", table);
    auto length = make_column("streak_length", table);
    auto win_flag = make_column("is_win_streak", table);
    auto loss_flag = make_column("is_loss_streak", table);

    int unknown = 0;
    for (auto& group : series.groups) {
        int cur_streak = 0;  // signed: +n wins, -n losses
        for (auto row : group.rows) {
            auto won = outcome(table.rows[row], options.result_column);
            if (!won) {
                cur_streak = 0;
                ++unknown;
            } else if (*won) {
                cur_streak = cur_streak > 0 ? cur_streak + 1 : 1;
            } else {
                cur_streak = cur_streak < 0 ? cur_streak - 1 : -1;
            }

            type.values[row] = cur_streak > 0 ? 1.0 : cur_streak < 0 ? -1.0 : 0.0;
            length.values[row] = static_cast<double>(cur_streak < 0 ? -cur_streak : cur_streak);
            win_flag.values[row] = cur_streak > 0 ? 1.0 : 0.0;
            loss_flag.values[row] = cur_streak < 0 ? 1.0 : 0.0;
        }
    }

    if (unknown > 0) {
        log.warn("{} rows have no win/loss result in '{}'", unknown, options.result_column);
    }

    return std::vector<FeatureColumn>{
        std::move(type), std::move(length), std::move(win_flag), std::move(loss_flag)};
}

} // namespace matchfeat

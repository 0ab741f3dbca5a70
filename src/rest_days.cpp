#include "matchfeat/rest_days.hpp"
#include "matchfeat/table.hpp"
#include "matchfeat/timestamp.hpp"
#include <cmath>
#include <optional>

namespace matchfeat {

namespace {

std::expected<void, FeatureError> require_timestamps(const GroupedSeries& series) {
    if (series.order != OrderSource::Timestamp) {
        return std::unexpected(FeatureError{
            ErrorKind::UnknownColumn, "series is not ordered by a timestamp column"});
    }
    return {};
}

} // namespace

FeatureResult rest_days(const RowTable& table, const GroupedSeries& series,
                        const RestDaysOptions& options, spdlog::logger& log) {

    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());
    if (auto ok = require_timestamps(series); !ok) return std::unexpected(ok.error());

    log.info("Calculating rest days between games");

    auto rest = make_column("rest_days", table);
    auto b2b = make_column("is_back_to_back", table);

    for (auto& group : series.groups) {
        for (std::size_t i = 0; i < group.size(); ++i) {
            int days = i == 0 ? options.first_game_days
                              : days_between(group.times[i - 1], group.times[i]);
            rest.values[group.rows[i]] = static_cast<double>(days);
            b2b.values[group.rows[i]] = days <= options.back_to_back_max_days ? 1.0 : 0.0;
        }
    }

    return std::vector<FeatureColumn>{std::move(rest), std::move(b2b)};
}

FeatureResult time_decay_weights(const RowTable& table, const GroupedSeries& series,
                                 const TimeDecayOptions& options, spdlog::logger& log) {

    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());
    if (auto ok = require_timestamps(series); !ok) return std::unexpected(ok.error());
    if (options.decay_rate < 0.0) {
        return std::unexpected(FeatureError{
            ErrorKind::InvalidArgument,
            "decay rate must not be negative, got " + format_number(options.decay_rate)});
    }

    log.info("Applying time decay weights (decay={})", options.decay_rate);

    std::optional<TimePoint> latest;
    for (auto& group : series.groups) {
        if (!group.times.empty() && (!latest || group.times.back() > *latest)) {
            latest = group.times.back();
        }
    }

    auto out = make_column(options.output_name, table);
    if (!latest) return std::vector<FeatureColumn>{std::move(out)};

    for (auto& group : series.groups) {
        for (std::size_t i = 0; i < group.size(); ++i) {
            int days_ago = days_between(group.times[i], *latest);
            out.values[group.rows[i]] = std::exp(-options.decay_rate * days_ago);
        }
    }

    return std::vector<FeatureColumn>{std::move(out)};
}

} // namespace matchfeat

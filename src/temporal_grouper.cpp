#include "matchfeat/temporal_grouper.hpp"
#include "matchfeat/table.hpp"
#include "matchfeat/timestamp.hpp"
#include <algorithm>
#include <numeric>
#include <unordered_map>

namespace matchfeat {

namespace {

std::expected<OrderSource, FeatureError> resolve_order(
    const RowTable& table, const GroupOptions& options, spdlog::logger& log) {

    if (options.timestamp_column && table.has_column(*options.timestamp_column)) {
        return OrderSource::Timestamp;
    }
    if (options.sequence_column && table.has_column(*options.sequence_column)) {
        if (options.timestamp_column) {
            log.info("No '{}' column, ordering by '{}'",
                     *options.timestamp_column, *options.sequence_column);
        }
        return OrderSource::Sequence;
    }
    if (options.timestamp_column) {
        return std::unexpected(FeatureError{
            ErrorKind::UnknownColumn,
            "unknown column '" + *options.timestamp_column + "'"});
    }
    if (options.sequence_column) {
        return std::unexpected(FeatureError{
            ErrorKind::UnknownColumn,
            "unknown column '" + *options.sequence_column + "'"});
    }
    return OrderSource::InputOrder;
}

} // namespace

std::expected<GroupedSeries, FeatureError> group_series(
    const RowTable& table, const GroupOptions& options, spdlog::logger& log) {

    if (options.group_column) {
        if (auto ok = require_columns(table, {*options.group_column}); !ok) {
            return std::unexpected(ok.error());
        }
    }

    auto order = resolve_order(table, options, log);
    if (!order) return std::unexpected(order.error());

    GroupedSeries series;
    series.group_column = options.group_column.value_or("");
    series.order = *order;
    series.row_count = table.size();

    std::unordered_map<std::string, std::size_t> group_index;

    for (std::size_t i = 0; i < table.size(); ++i) {
        auto& row = table.rows[i];

        double key = static_cast<double>(i);
        std::optional<TimePoint> time;

        if (series.order == OrderSource::Timestamp) {
            auto raw = row.text(*options.timestamp_column);
            if (!raw) {
                series.excluded.push_back({
                    .row = i,
                    .error = {ErrorKind::MalformedTimestamp,
                              "missing value in '" + *options.timestamp_column + "'"}});
                continue;
            }
            auto parsed = parse_timestamp(*raw);
            if (!parsed) {
                series.excluded.push_back({.row = i, .error = parsed.error()});
                continue;
            }
            time = *parsed;
            key = static_cast<double>(
                std::chrono::duration_cast<std::chrono::seconds>(
                    time->time_since_epoch()).count());
        } else if (series.order == OrderSource::Sequence) {
            auto seq = row.number(*options.sequence_column);
            if (!seq) {
                series.excluded.push_back({
                    .row = i,
                    .error = {ErrorKind::MalformedTimestamp,
                              "unparsable value in '" + *options.sequence_column + "'"}});
                continue;
            }
            key = *seq;
        }

        std::string entity = options.group_column
            ? row.text(*options.group_column).value_or("")
            : "";

        auto [it, inserted] = group_index.try_emplace(entity, series.groups.size());
        if (inserted) series.groups.push_back({.key = entity});

        auto& group = series.groups[it->second];
        group.rows.push_back(i);
        group.order_keys.push_back(key);
        if (time) group.times.push_back(*time);
    }

    for (auto& group : series.groups) {
        std::vector<std::size_t> perm(group.rows.size());
        std::iota(perm.begin(), perm.end(), std::size_t{0});
        std::ranges::stable_sort(perm, {}, [&](std::size_t p) { return group.order_keys[p]; });

        SeriesGroup sorted{.key = group.key};
        for (auto p : perm) {
            sorted.rows.push_back(group.rows[p]);
            sorted.order_keys.push_back(group.order_keys[p]);
            if (!group.times.empty()) sorted.times.push_back(group.times[p]);
        }
        group = std::move(sorted);
    }

    for (auto& ex : series.excluded) {
        log.warn("Row {} excluded from time ordering: {}", ex.row, ex.error.message);
    }
    log.info("Grouped {} rows into {} series ({} excluded)",
             table.size() - series.excluded.size(), series.groups.size(),
             series.excluded.size());

    return series;
}

TimeOrderedRows chronological_order(const GroupedSeries& series) {
    std::vector<std::pair<double, std::size_t>> keyed;
    for (auto& group : series.groups) {
        for (std::size_t i = 0; i < group.rows.size(); ++i) {
            keyed.emplace_back(group.order_keys[i], group.rows[i]);
        }
    }
    std::ranges::sort(keyed);

    TimeOrderedRows ordered;
    ordered.rows.reserve(keyed.size());
    ordered.order_keys.reserve(keyed.size());
    for (auto& [key, row] : keyed) {
        ordered.rows.push_back(row);
        ordered.order_keys.push_back(key);
    }
    return ordered;
}

std::vector<std::size_t> chronological_rows(const GroupedSeries& series) {
    return chronological_order(series).rows;
}

} // namespace matchfeat

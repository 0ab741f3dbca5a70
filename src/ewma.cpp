#include "matchfeat/ewma.hpp"
#include "matchfeat/table.hpp"

namespace matchfeat {

std::expected<double, FeatureError> resolve_alpha(const EwmaOptions& options) {
    if (options.alpha.has_value() == options.span.has_value()) {
        return std::unexpected(FeatureError{
            ErrorKind::InvalidArgument, "ewma needs exactly one of alpha or span"});
    }

    double alpha = options.alpha ? *options.alpha : 2.0 / (*options.span + 1.0);
    if (options.span && *options.span <= 0.0) {
        return std::unexpected(FeatureError{
            ErrorKind::InvalidArgument,
            "span must be positive, got " + format_number(*options.span)});
    }
    if (!(alpha > 0.0 && alpha <= 1.0)) {
        return std::unexpected(FeatureError{
            ErrorKind::InvalidArgument,
            "alpha must be in (0, 1], got " + format_number(alpha)});
    }
    return alpha;
}

std::string ewma_column_name(const EwmaOptions& options) {
    if (!options.output_name.empty()) return options.output_name;
    if (options.span) return options.column + "_ewma_" + format_number(*options.span);
    return options.column + "_ewma_alpha" + format_number(options.alpha.value_or(0.0));
}

FeatureResult ewma(const RowTable& table, const GroupedSeries& series,
                   const EwmaOptions& options, spdlog::logger& log) {

    auto alpha = resolve_alpha(options);
    if (!alpha) return std::unexpected(alpha.error());
    if (auto ok = require_columns(table, {options.column}); !ok) return std::unexpected(ok.error());
    if (auto ok = require_series(table, series); !ok) return std::unexpected(ok.error());

    log.info("Calculating EWMA of '{}' (alpha={})", options.column, *alpha);

    auto out = make_column(ewma_column_name(options), table);

    for (auto& group : series.groups) {
        std::optional<double> e;
        for (auto row : group.rows) {
            if (auto x = table.rows[row].number(options.column)) {
                e = e ? *alpha * *x + (1.0 - *alpha) * *e : *x;
            }
            out.values[row] = e;
        }
    }

    return std::vector<FeatureColumn>{std::move(out)};
}

} // namespace matchfeat

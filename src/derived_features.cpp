#include "matchfeat/derived_features.hpp"
#include "matchfeat/table.hpp"
#include <cmath>

namespace matchfeat {

std::string rate_column_name(const RateOptions& options) {
    if (!options.output_name.empty()) return options.output_name;
    return options.numerator + "_per_" + options.denominator;
}

FeatureResult rate(const RowTable& table, const RateOptions& options, spdlog::logger& log) {
    if (auto ok = require_columns(table, {options.numerator, options.denominator}); !ok) {
        return std::unexpected(ok.error());
    }

    log.info("Calculating rate {} / {}", options.numerator, options.denominator);

    auto out = make_column(rate_column_name(options), table);
    int zero = 0;
    for (std::size_t i = 0; i < table.size(); ++i) {
        auto num = table.rows[i].number(options.numerator);
        auto den = table.rows[i].number(options.denominator);
        if (!num || !den) continue;
        if (*den == 0.0) {
            out.values[i] = options.zero_denominator;
            ++zero;
            continue;
        }
        out.values[i] = *num / *den;
    }

    if (zero > 0) log.debug("{} rows have a zero '{}'", zero, options.denominator);
    return std::vector<FeatureColumn>{std::move(out)};
}

std::string interaction_column_name(const InteractionOptions& options) {
    if (!options.output_name.empty()) return options.output_name;
    return options.left + "_x_" + options.right;
}

FeatureResult interaction(const RowTable& table, const InteractionOptions& options,
                          spdlog::logger& log) {
    if (auto ok = require_columns(table, {options.left, options.right}); !ok) {
        return std::unexpected(ok.error());
    }

    log.info("Creating interaction: {} x {}", options.left, options.right);

    auto out = make_column(interaction_column_name(options), table);
    for (std::size_t i = 0; i < table.size(); ++i) {
        auto a = table.rows[i].number(options.left);
        auto b = table.rows[i].number(options.right);
        if (a && b) out.values[i] = *a * *b;
    }
    return std::vector<FeatureColumn>{std::move(out)};
}

std::vector<std::string> polynomial_column_names(const PolynomialOptions& options) {
    std::vector<std::string> names;
    for (int d = 2; d <= options.degree; ++d) {
        names.push_back(options.column + "_pow" + std::to_string(d));
    }
    return names;
}

FeatureResult polynomial(const RowTable& table, const PolynomialOptions& options,
                         spdlog::logger& log) {
    if (options.degree < 2) {
        return std::unexpected(FeatureError{
            ErrorKind::InvalidArgument,
            "polynomial degree must be at least 2, got " + std::to_string(options.degree)});
    }
    if (auto ok = require_columns(table, {options.column}); !ok) return std::unexpected(ok.error());

    log.info("Creating polynomial features for '{}' (degree {})", options.column, options.degree);

    std::vector<FeatureColumn> result;
    auto names = polynomial_column_names(options);
    for (int d = 2; d <= options.degree; ++d) {
        auto out = make_column(names[d - 2], table);
        for (std::size_t i = 0; i < table.size(); ++i) {
            if (auto v = table.rows[i].number(options.column)) out.values[i] = std::pow(*v, d);
        }
        result.push_back(std::move(out));
    }
    return result;
}

} // namespace matchfeat

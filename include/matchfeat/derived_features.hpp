#pragma once

#include "matchfeat/logging.hpp"
#include "matchfeat/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace matchfeat {

struct RateOptions {
    std::string numerator;
    std::string denominator;
    std::string output_name;                 // default: <numerator>_per_<denominator>
    std::optional<double> zero_denominator;  // value when the denominator is 0; unset if empty
};

std::string rate_column_name(const RateOptions& options);

FeatureResult rate(const RowTable& table, const RateOptions& options,
                   spdlog::logger& log = null_logger());

struct InteractionOptions {
    std::string left;
    std::string right;
    std::string output_name;  // default: <left>_x_<right>
};

std::string interaction_column_name(const InteractionOptions& options);

FeatureResult interaction(const RowTable& table, const InteractionOptions& options,
                          spdlog::logger& log = null_logger());

struct PolynomialOptions {
    std::string column;
    int degree = 2;
};

std::vector<std::string> polynomial_column_names(const PolynomialOptions& options);

// <column>_pow<d> for d = 2..degree.
FeatureResult polynomial(const RowTable& table, const PolynomialOptions& options,
                         spdlog::logger& log = null_logger());

} // namespace matchfeat

#include "matchfeat/table.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <unordered_set>

namespace matchfeat {

namespace {

std::string_view trim(std::string_view sv) {
    auto start = sv.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    auto end = sv.find_last_not_of(" \t\r\n");
    return sv.substr(start, end - start + 1);
}

std::string upper(std::string_view sv) {
    std::string out(sv);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return std::toupper(c); });
    return out;
}

} // namespace

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedTimestamp: return "MalformedTimestamp";
        case ErrorKind::InsufficientData: return "InsufficientData";
        case ErrorKind::UndefinedMetric: return "UndefinedMetric";
        case ErrorKind::UnknownColumn: return "UnknownColumn";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::DuplicateColumn: return "DuplicateColumn";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
        case ErrorKind::Io: return "Io";
    }
    return "Unknown";
}

std::optional<double> parse_number(std::string_view text) {
    auto sv = trim(text);
    if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);
    if (sv.empty()) return std::nullopt;

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

std::string format_number(double value) {
    std::array<char, 32> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{}) return std::to_string(value);
    return std::string(buf.data(), ptr);
}

std::optional<double> Record::number(const std::string& column) const {
    auto it = fields.find(column);
    if (it == fields.end()) return std::nullopt;
    if (auto* d = std::get_if<double>(&it->second)) {
        return std::isfinite(*d) ? std::optional<double>(*d) : std::nullopt;
    }
    return parse_number(std::get<std::string>(it->second));
}

std::optional<std::string> Record::text(const std::string& column) const {
    auto it = fields.find(column);
    if (it == fields.end()) return std::nullopt;
    if (auto* d = std::get_if<double>(&it->second)) return format_number(*d);
    return std::get<std::string>(it->second);
}

bool RowTable::has_column(std::string_view name) const {
    return std::ranges::find(columns, name) != columns.end();
}

std::optional<bool> outcome(const Record& record, const std::string& column) {
    auto it = record.fields.find(column);
    if (it == record.fields.end()) return std::nullopt;

    if (auto* d = std::get_if<double>(&it->second)) return *d > 0.0;

    auto token = upper(trim(std::get<std::string>(it->second)));
    if (token == "W" || token == "WIN" || token == "TRUE") return true;
    if (token == "L" || token == "LOSS" || token == "FALSE") return false;
    if (auto n = parse_number(token)) return *n > 0.0;
    return std::nullopt;
}

std::expected<void, FeatureError> require_columns(
    const RowTable& table, std::initializer_list<std::string_view> names) {

    for (auto name : names) {
        if (!table.has_column(name)) {
            return std::unexpected(FeatureError{
                ErrorKind::UnknownColumn,
                "unknown column '" + std::string(name) + "'"});
        }
    }
    return {};
}

std::expected<void, FeatureError> require_series(
    const RowTable& table, const GroupedSeries& series) {

    if (series.row_count != table.size()) {
        return std::unexpected(FeatureError{
            ErrorKind::InvalidArgument,
            "series was grouped from " + std::to_string(series.row_count) +
                " rows but the table has " + std::to_string(table.size())});
    }
    return {};
}

FeatureColumn make_column(std::string name, const RowTable& table) {
    return {.name = std::move(name),
            .values = std::vector<std::optional<double>>(table.size())};
}

std::expected<void, FeatureError> apply_features(
    RowTable& table, std::vector<FeatureColumn> features) {

    std::unordered_set<std::string> incoming;
    for (auto& f : features) {
        if (f.values.size() != table.size()) {
            return std::unexpected(FeatureError{
                ErrorKind::InvalidArgument,
                "feature '" + f.name + "' has " + std::to_string(f.values.size()) +
                    " values for " + std::to_string(table.size()) + " rows"});
        }
        if (table.has_column(f.name) || !incoming.insert(f.name).second) {
            return std::unexpected(FeatureError{
                ErrorKind::DuplicateColumn,
                "column '" + f.name + "' already exists"});
        }
    }

    for (auto& f : features) {
        for (std::size_t i = 0; i < f.values.size(); ++i) {
            if (f.values[i]) table.rows[i].set(f.name, *f.values[i]);
        }
        table.columns.push_back(std::move(f.name));
    }
    return {};
}

RowTable take_rows(const RowTable& table, const std::vector<std::size_t>& rows) {
    RowTable out;
    out.columns = table.columns;
    out.rows.reserve(rows.size());
    for (auto row : rows) out.rows.push_back(table.rows.at(row));
    return out;
}

} // namespace matchfeat

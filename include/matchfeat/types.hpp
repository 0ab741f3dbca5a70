#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace matchfeat {

using TimePoint = std::chrono::system_clock::time_point;

// A field is either a number or a string; an absent field has no entry.
using Value = std::variant<double, std::string>;

enum class ErrorKind {
    MalformedTimestamp,
    InsufficientData,
    UndefinedMetric,
    UnknownColumn,
    InvalidArgument,
    DuplicateColumn,
    InvalidConfig,
    Io,
};

struct FeatureError {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;
};

std::string_view to_string(ErrorKind kind);

struct Record {
    std::unordered_map<std::string, Value> fields;

    bool has(const std::string& column) const { return fields.contains(column); }

    // Numeric view of a field. Strings must parse completely to a finite number.
    std::optional<double> number(const std::string& column) const;

    std::optional<std::string> text(const std::string& column) const;

    void set(const std::string& column, Value value) {
        fields[column] = std::move(value);
    }
};

struct RowTable {
    std::vector<std::string> columns;
    std::vector<Record> rows;

    bool has_column(std::string_view name) const;
    std::size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }
};

// Output of a feature pass: one optional value per table row, by position.
struct FeatureColumn {
    std::string name;
    std::vector<std::optional<double>> values;
};

using FeatureResult = std::expected<std::vector<FeatureColumn>, FeatureError>;

enum class OrderSource { InputOrder, Sequence, Timestamp };

struct SeriesGroup {
    std::string key;
    std::vector<std::size_t> rows;   // table positions, ascending in time
    std::vector<double> order_keys;  // sort key of each entry in rows
    std::vector<TimePoint> times;    // filled only for OrderSource::Timestamp

    std::size_t size() const { return rows.size(); }
};

struct ExcludedRow {
    std::size_t row = 0;
    FeatureError error;
};

struct GroupedSeries {
    std::string group_column;  // empty when the whole table is one series
    OrderSource order = OrderSource::InputOrder;
    std::vector<SeriesGroup> groups;
    std::vector<ExcludedRow> excluded;
    std::size_t row_count = 0;  // table size the series was built from
};

// Which rows a season aggregate may read when computing row i's value.
enum class AggregateScope {
    Season,        // every row, including later games
    AsOfRow,       // rows ordered at or before row i, same-time rows included
    StrictlyPast,  // rows ordered strictly before row i
};

struct Fold {
    int index = 0;  // 1-based
    std::vector<std::size_t> train;
    std::vector<std::size_t> test;

    std::size_t train_size() const { return train.size(); }
    std::size_t test_size() const { return test.size(); }
};

struct StratifiedSplit {
    std::vector<std::size_t> train;
    std::vector<std::size_t> test;
};

} // namespace matchfeat

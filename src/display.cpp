#include "matchfeat/display.hpp"
#include "matchfeat/csv.hpp"
#include "matchfeat/timestamp.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace matchfeat {

namespace {

using namespace ftxui;

// -- Formatting helpers --

std::string f3(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << v;
    return oss.str();
}

std::string fopt(const std::optional<double>& v) {
    return v ? f3(*v) : "-";
}

std::string fpct(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (v * 100.0) << "%";
    return oss.str();
}

std::string date_of(const RowTable& table, std::size_t row, const std::string& column) {
    auto raw = table.rows[row].text(column);
    if (!raw) return "-";
    auto tp = parse_timestamp(*raw);
    return tp ? format_date(*tp) : "-";
}

std::string span_of(const RowTable& table, const std::vector<std::size_t>& rows,
                    const std::string& column) {
    if (rows.empty()) return "-";
    return date_of(table, rows.front(), column) + " .. " + date_of(table, rows.back(), column);
}

Color coverage_color(std::size_t count, std::size_t total) {
    if (total == 0 || count == total) return Color::Green;
    if (count * 2 >= total) return Color::Yellow;
    return Color::Red;
}

void print_element(Element doc) {
    auto screen = Screen::Create(Dimension::Fit(doc));
    Render(screen, doc);
    screen.Print();
    std::cout << "\n";
}

void print_csv(const std::vector<std::vector<std::string>>& rows) {
    for (auto& row : rows) write_csv_row(std::cout, row);
}

Element titled(const std::string& title, Element body) {
    return vbox({
        text(title) | bold | color(Color::Cyan),
        separator(),
        std::move(body),
    });
}

} // namespace

void display_grouping(const GroupedSeries& series, OutputFormat format) {
    std::size_t grouped = 0;
    for (auto& g : series.groups) grouped += g.size();

    std::string order = series.order == OrderSource::Timestamp ? "timestamp"
                      : series.order == OrderSource::Sequence  ? "sequence"
                                                               : "input order";
    std::string by = series.group_column.empty() ? "(single series)" : series.group_column;

    if (format == OutputFormat::Csv) {
        print_csv({
            {"group_column", "order", "groups", "rows", "excluded"},
            {by, order, std::to_string(series.groups.size()), std::to_string(grouped),
             std::to_string(series.excluded.size())},
        });
        return;
    }

    auto stat_box = [](const std::string& label, const std::string& value, Color c) {
        return vbox({
            text(value) | bold | color(c) | center,
            text(label) | dim | center,
        }) | size(WIDTH, EQUAL, 16) | borderLight;
    };

    print_element(titled("Series", hbox({
        stat_box("Grouped By", by, Color::White),
        stat_box("Ordered By", order, Color::White),
        stat_box("Groups", std::to_string(series.groups.size()), Color::White),
        stat_box("Rows", std::to_string(grouped), Color::Green),
        stat_box("Excluded", std::to_string(series.excluded.size()),
                 series.excluded.empty() ? Color::Green : Color::Red),
    })));
}

void display_features(const std::vector<FeatureSummary>& features, OutputFormat format) {
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Feature", "Values", "Mean", "Min", "Max"});
    for (auto& f : features) {
        rows.push_back({
            f.name, std::to_string(f.count), fopt(f.mean), fopt(f.min), fopt(f.max),
        });
    }

    if (format == OutputFormat::Csv) {
        print_csv(rows);
        return;
    }
    if (features.empty()) {
        print_element(text("No features added.") | dim);
        return;
    }

    std::size_t most = 0;
    for (auto& f : features) most = std::max(most, f.count);

    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).SeparatorVertical(LIGHT);
    table.SelectAll().Border(LIGHT);
    for (std::size_t i = 1; i < rows.size(); ++i) {
        table.SelectCell(1, i).Decorate(color(coverage_color(features[i - 1].count, most)));
    }

    print_element(titled("Features Added", table.Render()));
}

void display_folds(const std::vector<Fold>& folds, const RowTable& table,
                   const std::string& timestamp_column, OutputFormat format) {
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Fold", "Train", "Test", "Train Dates", "Test Dates"});
    for (auto& fold : folds) {
        rows.push_back({
            std::to_string(fold.index),
            std::to_string(fold.train_size()),
            std::to_string(fold.test_size()),
            span_of(table, fold.train, timestamp_column),
            span_of(table, fold.test, timestamp_column),
        });
    }

    if (format == OutputFormat::Csv) {
        print_csv(rows);
        return;
    }

    auto t = Table(rows);
    t.SelectRow(0).Decorate(bold);
    t.SelectAll().Border(LIGHT);
    for (std::size_t i = 1; i < rows.size(); ++i) {
        if (folds[i - 1].train.empty()) t.SelectCell(1, i).Decorate(color(Color::Red));
    }

    print_element(titled("Time Series Folds", t.Render()));
}

void display_split(const StratifiedSplit& split, const RowTable& table,
                   const std::string& target_column, OutputFormat format) {
    // class -> (train, test), ordered by class label
    std::map<std::string, std::pair<std::size_t, std::size_t>> counts;
    for (auto row : split.train) ++counts[table.rows[row].text(target_column).value_or("")].first;
    for (auto row : split.test) ++counts[table.rows[row].text(target_column).value_or("")].second;

    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Class", "Train", "Test", "Test Share"});
    for (auto& [label, c] : counts) {
        auto total = c.first + c.second;
        rows.push_back({
            label.empty() ? "(missing)" : label,
            std::to_string(c.first),
            std::to_string(c.second),
            fpct(total > 0 ? static_cast<double>(c.second) / static_cast<double>(total) : 0.0),
        });
    }

    if (format == OutputFormat::Csv) {
        print_csv(rows);
        return;
    }

    auto t = Table(rows);
    t.SelectRow(0).Decorate(bold);
    t.SelectAll().Border(LIGHT);

    print_element(titled("Stratified Split on " + target_column, vbox({
        t.Render(),
        hbox({
            text("  Train: ") | dim,
            text(std::to_string(split.train.size())) | bold | color(Color::Green),
            text("    Test: ") | dim,
            text(std::to_string(split.test.size())) | bold | color(Color::Yellow),
        }),
    })));
}

} // namespace matchfeat

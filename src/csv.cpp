#include "matchfeat/csv.hpp"
#include "matchfeat/table.hpp"
#include <fstream>
#include <istream>
#include <ostream>

namespace matchfeat {

namespace {

void skip_bom(std::istream& in) {
    if (in.peek() != 0xEF) return;
    char bom[3];
    in.read(bom, 3);
    if (in.gcount() == 3 && static_cast<unsigned char>(bom[1]) == 0xBB &&
        static_cast<unsigned char>(bom[2]) == 0xBF) {
        return;
    }
    in.clear();
    in.seekg(0);
}

// Reads one logical record; quoted fields may span lines.
bool read_record(std::istream& in, std::string& record) {
    record.clear();
    std::string line;
    bool in_quotes = false;
    bool any = false;
    while (std::getline(in, line)) {
        any = true;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!record.empty() || in_quotes) record += '\n';
        record += line;
        for (char c : line) {
            if (c == '"') in_quotes = !in_quotes;
        }
        if (!in_quotes) return true;
    }
    return any;
}

bool needs_quotes(const std::string& s) {
    return s.find_first_of(",\"\n\r") != std::string::npos;
}

std::string quote(const std::string& s) {
    if (!needs_quotes(s)) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                in_quotes = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

std::expected<RowTable, FeatureError> parse_csv(std::istream& in) {
    skip_bom(in);

    RowTable table;
    std::string record;
    if (!read_record(in, record)) {
        return std::unexpected(FeatureError{ErrorKind::Io, "CSV input has no header row"});
    }
    table.columns = split_csv_line(record);

    std::size_t line_no = 1;
    while (read_record(in, record)) {
        ++line_no;
        if (record.empty()) continue;

        auto cells = split_csv_line(record);
        if (cells.size() > table.columns.size()) {
            return std::unexpected(FeatureError{
                ErrorKind::Io,
                "record " + std::to_string(line_no) + " has " + std::to_string(cells.size()) +
                    " fields, header has " + std::to_string(table.columns.size())});
        }

        Record row;
        for (std::size_t c = 0; c < cells.size(); ++c) {
            if (!cells[c].empty()) row.set(table.columns[c], std::move(cells[c]));
        }
        table.rows.push_back(std::move(row));
    }

    return table;
}

std::expected<RowTable, FeatureError> read_csv(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(FeatureError{ErrorKind::Io, "cannot open " + path.string()});
    }
    return parse_csv(file);
}

void write_csv_row(std::ostream& out, const std::vector<std::string>& fields) {
    for (std::size_t c = 0; c < fields.size(); ++c) {
        if (c > 0) out << ',';
        out << quote(fields[c]);
    }
    out << '\n';
}

void write_csv(std::ostream& out, const RowTable& table) {
    write_csv_row(out, table.columns);

    for (auto& row : table.rows) {
        for (std::size_t c = 0; c < table.columns.size(); ++c) {
            if (c > 0) out << ',';
            if (auto v = row.text(table.columns[c])) out << quote(*v);
        }
        out << '\n';
    }
}

std::expected<void, FeatureError> write_csv(const std::filesystem::path& path,
                                            const RowTable& table) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return std::unexpected(FeatureError{ErrorKind::Io, "cannot write " + path.string()});
    }
    write_csv(file, table);
    if (!file) {
        return std::unexpected(FeatureError{ErrorKind::Io, "write failed for " + path.string()});
    }
    return {};
}

} // namespace matchfeat

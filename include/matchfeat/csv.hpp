#pragma once

#include "matchfeat/types.hpp"
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace matchfeat {

// Header row gives the columns; every cell is kept as a string and empty
// cells are left absent.
std::expected<RowTable, FeatureError> parse_csv(std::istream& in);
std::expected<RowTable, FeatureError> read_csv(const std::filesystem::path& path);

void write_csv(std::ostream& out, const RowTable& table);
std::expected<void, FeatureError> write_csv(const std::filesystem::path& path,
                                            const RowTable& table);

// One record, fields quoted where they hold a comma, quote or line break.
void write_csv_row(std::ostream& out, const std::vector<std::string>& fields);

std::vector<std::string> split_csv_line(const std::string& line);

} // namespace matchfeat

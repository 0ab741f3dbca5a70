#pragma once

#include "matchfeat/types.hpp"
#include <expected>
#include <string>
#include <string_view>

namespace matchfeat {

// Accepts YYYY-MM-DD (or YYYY/MM/DD), optionally followed by 'T' or ' ' and
// HH:MM[:SS[.fff]] with an optional trailing 'Z'. Times are UTC.
std::expected<TimePoint, FeatureError> parse_timestamp(std::string_view text);

// Whole calendar days from `earlier` to `later` (negative if reversed).
int days_between(TimePoint earlier, TimePoint later);

std::string format_date(TimePoint tp);

} // namespace matchfeat

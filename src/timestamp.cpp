#include "matchfeat/timestamp.hpp"
#include <charconv>
#include <cstdio>

namespace matchfeat {

namespace {

using namespace std::chrono;

bool read_digits(std::string_view& sv, std::size_t count, int& out) {
    if (sv.size() < count) return false;
    for (std::size_t i = 0; i < count; ++i) {
        if (sv[i] < '0' || sv[i] > '9') return false;
    }
    std::from_chars(sv.data(), sv.data() + count, out);
    sv.remove_prefix(count);
    return true;
}

bool consume(std::string_view& sv, char c) {
    if (sv.empty() || sv.front() != c) return false;
    sv.remove_prefix(1);
    return true;
}

std::unexpected<FeatureError> malformed(std::string_view text) {
    return std::unexpected(FeatureError{
        ErrorKind::MalformedTimestamp,
        "cannot parse timestamp '" + std::string(text) + "'"});
}

} // namespace

std::expected<TimePoint, FeatureError> parse_timestamp(std::string_view text) {
    auto sv = text;
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' ||
                           sv.back() == '\r')) sv.remove_suffix(1);

    int y = 0, m = 0, d = 0;
    if (!read_digits(sv, 4, y)) return malformed(text);
    char sep = sv.empty() ? '\0' : sv.front();
    if (sep != '-' && sep != '/') return malformed(text);
    sv.remove_prefix(1);
    if (!read_digits(sv, 2, m) || !consume(sv, sep) || !read_digits(sv, 2, d)) {
        return malformed(text);
    }

    year_month_day ymd{year{y}, month{static_cast<unsigned>(m)},
                       day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return malformed(text);

    int hh = 0, mm = 0, ss = 0;
    if (!sv.empty() && (sv.front() == 'T' || sv.front() == ' ')) {
        sv.remove_prefix(1);
        if (!read_digits(sv, 2, hh) || !consume(sv, ':') || !read_digits(sv, 2, mm)) {
            return malformed(text);
        }
        if (consume(sv, ':')) {
            if (!read_digits(sv, 2, ss)) return malformed(text);
            if (consume(sv, '.')) {
                std::size_t digits = 0;
                while (digits < sv.size() && sv[digits] >= '0' && sv[digits] <= '9') ++digits;
                if (digits == 0) return malformed(text);
                sv.remove_prefix(digits);
            }
        }
        if (hh > 23 || mm > 59 || ss > 60) return malformed(text);
    }
    consume(sv, 'Z');
    if (!sv.empty()) return malformed(text);

    return sys_days(ymd) + hours(hh) + minutes(mm) + seconds(ss);
}

int days_between(TimePoint earlier, TimePoint later) {
    auto a = floor<days>(earlier);
    auto b = floor<days>(later);
    return static_cast<int>((b - a).count());
}

std::string format_date(TimePoint tp) {
    year_month_day ymd{floor<days>(tp)};
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    return buf;
}

} // namespace matchfeat

// common/utils/time_utils.cpp
#include "common/utils/time_utils.h"
#include <cstdio>

namespace agenttrace {

namespace {

// Howard Hinnant's days_from_civil / civil_from_days.
int64_t days_from_civil(int64_t y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civil_from_days(int64_t z, int64_t& y, int& m, int& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = yoe + era * 400 + (m <= 2 ? 1 : 0);
}

bool is_leap_year(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int64_t y, int m) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return kDays[m - 1];
}

// Reads exactly `count` digits starting at `pos`.
bool read_digits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        char c = text[i];
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // namespace

std::optional<TimePoint> parse_rfc3339(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS is 19 characters, plus at least the zone designator.
    if (text.size() < 20) return std::nullopt;

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(text, 0, 4, year) || text[4] != '-' ||
        !read_digits(text, 5, 2, month) || text[7] != '-' ||
        !read_digits(text, 8, 2, day) ||
        (text[10] != 'T' && text[10] != 't') ||
        !read_digits(text, 11, 2, hour) || text[13] != ':' ||
        !read_digits(text, 14, 2, minute) || text[16] != ':' ||
        !read_digits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    int64_t nanos = 0;
    if (text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        int64_t scale = 100000000;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 9) {
                nanos += (text[pos] - '0') * scale;
                scale /= 10;
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
    }

    if (pos >= text.size()) return std::nullopt;

    int64_t offset_seconds = 0;
    char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
        ++pos;
    } else if (zone == '+' || zone == '-') {
        int off_h = 0, off_m = 0;
        if (!read_digits(text, pos + 1, 2, off_h) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
            !read_digits(text, pos + 4, 2, off_m) || off_h > 23 || off_m > 59) {
            return std::nullopt;
        }
        offset_seconds = (off_h * 3600 + off_m * 60) * (zone == '-' ? -1 : 1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) return std::nullopt;

    int64_t days = days_from_civil(year, month, day);
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
    auto since_epoch = std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanos);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(since_epoch));
}

std::string format_rfc3339(TimePoint tp) {
    int64_t millis = to_unix_millis(tp);
    int64_t days = millis >= 0 ? millis / 86400000 : (millis - 86399999) / 86400000;
    int64_t ms_of_day = millis - days * 86400000;

    int64_t year = 0;
    int month = 0, day = 0;
    civil_from_days(days, year, month, day);

    int hour = static_cast<int>(ms_of_day / 3600000);
    int minute = static_cast<int>((ms_of_day / 60000) % 60);
    int second = static_cast<int>((ms_of_day / 1000) % 60);
    int ms = static_cast<int>(ms_of_day % 1000);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(year), month, day, hour, minute, second, ms);
    return buf;
}

int64_t duration_ms_between(std::string_view start, std::string_view end) {
    if (start.empty() || end.empty()) return 0;
    auto s = parse_rfc3339(start);
    if (!s) return 0;
    auto e = parse_rfc3339(end);
    if (!e) return 0;
    return std::chrono::duration_cast<std::chrono::milliseconds>(*e - *s).count();
}

int64_t to_unix_millis(TimePoint tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    // duration_cast truncates toward zero; floor for pre-epoch instants.
    if (tp.time_since_epoch() < std::chrono::milliseconds(ms)) --ms;
    return ms;
}

} // namespace agenttrace

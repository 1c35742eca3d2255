#include "date_parser.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cctype>

namespace {

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) return 29;
    return days[month - 1];
}

// Reads between min_digits and max_digits decimal digits starting at pos
std::optional<int> read_digits(const std::string& text, size_t& pos,
                               size_t min_digits, size_t max_digits) {
    size_t start = pos;
    int value = 0;
    while (pos < text.length() && pos - start < max_digits &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
        value = value * 10 + (text[pos] - '0');
        pos++;
    }
    if (pos - start < min_digits) return std::nullopt;
    return value;
}

bool in_range(int value, int lo, int hi) {
    return value >= lo && value <= hi;
}

} // namespace

int64_t CalendarDate::days_since_epoch() const {
    // Civil-from-days inverse (proleptic Gregorian)
    int64_t y = year - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t mp = (month + 9) % 12;
    int64_t doy = (153 * mp + 2) / 5 + day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::string CalendarDate::to_iso_string() const {
    return fmt::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

bool CalendarDate::is_valid(int year, int month, int day) {
    if (!in_range(year, 1, 9999) || !in_range(month, 1, 12)) return false;
    return in_range(day, 1, days_in_month(year, month));
}

CalendarDate CalendarDate::today_utc() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&itt, &tm_utc);
    
    CalendarDate today;
    today.year = tm_utc.tm_year + 1900;
    today.month = tm_utc.tm_mon + 1;
    today.day = tm_utc.tm_mday;
    return today;
}

bool CalendarDate::operator==(const CalendarDate& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool CalendarDate::operator<(const CalendarDate& other) const {
    return days_since_epoch() < other.days_since_epoch();
}

const std::vector<std::string>& DateParser::known_formats() {
    static const std::vector<std::string> formats = {
        "%Y-%m-%d",
        "%Y-%m-%dT%H:%M:%SZ",
        "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%d %H:%M:%S"
    };
    return formats;
}

std::optional<CalendarDate> DateParser::parse(const std::string& text) {
    std::string value = util::trim(text);
    if (value.empty()) return std::nullopt;
    
    for (const auto& format : known_formats()) {
        if (auto date = try_format(value, format)) {
            return date;
        }
    }
    
    // Generic ISO-8601 with 'Z' read as a zero offset
    std::string iso = value;
    size_t z = iso.find('Z');
    while (z != std::string::npos) {
        iso.replace(z, 1, "+00:00");
        z = iso.find('Z', z + 6);
    }
    return parse_iso8601(iso);
}

std::optional<CalendarDate> DateParser::parse_iso_date(const std::string& text) {
    size_t pos = 0;
    auto year = read_digits(text, pos, 4, 4);
    if (!year || pos >= text.length() || text[pos++] != '-') return std::nullopt;
    auto month = read_digits(text, pos, 2, 2);
    if (!month || pos >= text.length() || text[pos++] != '-') return std::nullopt;
    auto day = read_digits(text, pos, 2, 2);
    if (!day || pos != text.length()) return std::nullopt;
    
    if (!CalendarDate::is_valid(*year, *month, *day)) return std::nullopt;
    return CalendarDate{*year, *month, *day};
}

std::optional<CalendarDate> DateParser::try_format(const std::string& text,
                                                   const std::string& format) {
    int year = 0, month = 0, day = 0;
    size_t pos = 0;
    
    for (size_t i = 0; i < format.length(); i++) {
        if (format[i] != '%') {
            if (pos >= text.length() || text[pos] != format[i]) return std::nullopt;
            pos++;
            continue;
        }
        if (++i >= format.length()) return std::nullopt;
        
        std::optional<int> field;
        switch (format[i]) {
            case 'Y':
                field = read_digits(text, pos, 4, 4);
                if (field) year = *field;
                break;
            case 'm':
                field = read_digits(text, pos, 1, 2);
                if (field && !in_range(*field, 1, 12)) return std::nullopt;
                if (field) month = *field;
                break;
            case 'd':
                field = read_digits(text, pos, 1, 2);
                if (field && !in_range(*field, 1, 31)) return std::nullopt;
                if (field) day = *field;
                break;
            case 'H':
                field = read_digits(text, pos, 1, 2);
                if (field && !in_range(*field, 0, 23)) return std::nullopt;
                break;
            case 'M':
                field = read_digits(text, pos, 1, 2);
                if (field && !in_range(*field, 0, 59)) return std::nullopt;
                break;
            case 'S':
                field = read_digits(text, pos, 1, 2);
                if (field && !in_range(*field, 0, 59)) return std::nullopt;
                break;
            default:
                return std::nullopt;
        }
        if (!field) return std::nullopt;
    }
    
    if (pos != text.length()) return std::nullopt;
    if (!CalendarDate::is_valid(year, month, day)) return std::nullopt;
    return CalendarDate{year, month, day};
}

std::optional<CalendarDate> DateParser::parse_iso8601(const std::string& text) {
    // YYYY-MM-DD[(T| )HH[:MM[:SS[.ffffff]]][(+|-)HH[:?MM]]]
    size_t date_len = 10;
    if (text.length() < date_len) return std::nullopt;
    auto date = parse_iso_date(text.substr(0, date_len));
    if (!date) return std::nullopt;
    if (text.length() == date_len) return date;
    
    size_t pos = date_len;
    char sep = text[pos++];
    if (sep != 'T' && sep != 't' && sep != ' ') return std::nullopt;
    
    auto hour = read_digits(text, pos, 2, 2);
    if (!hour || !in_range(*hour, 0, 23)) return std::nullopt;
    
    if (pos < text.length() && text[pos] == ':') {
        pos++;
        auto minute = read_digits(text, pos, 2, 2);
        if (!minute || !in_range(*minute, 0, 59)) return std::nullopt;
        
        if (pos < text.length() && text[pos] == ':') {
            pos++;
            auto second = read_digits(text, pos, 2, 2);
            if (!second || !in_range(*second, 0, 59)) return std::nullopt;
            
            if (pos < text.length() && (text[pos] == '.' || text[pos] == ',')) {
                pos++;
                if (!read_digits(text, pos, 1, 6)) return std::nullopt;
            }
        }
    }
    
    if (pos == text.length()) return date;
    
    // UTC offset; the calendar date is the one written, not shifted to UTC
    if (text[pos] != '+' && text[pos] != '-') return std::nullopt;
    pos++;
    auto offset_hours = read_digits(text, pos, 2, 2);
    if (!offset_hours || !in_range(*offset_hours, 0, 23)) return std::nullopt;
    if (pos < text.length() && text[pos] == ':') pos++;
    auto offset_minutes = read_digits(text, pos, 2, 2);
    if (!offset_minutes || !in_range(*offset_minutes, 0, 59)) return std::nullopt;
    
    if (pos != text.length()) return std::nullopt;
    return date;
}

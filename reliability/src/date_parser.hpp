#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;
    
    int64_t days_since_epoch() const;
    std::string to_iso_string() const;
    
    static bool is_valid(int year, int month, int day);
    static CalendarDate today_utc();
    
    bool operator==(const CalendarDate& other) const;
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const;
};

// Permissive timestamp parsing for oracle-supplied dates. A result of
// std::nullopt means "undated"; callers must treat such records as never recent.
class DateParser {
public:
    static std::optional<CalendarDate> parse(const std::string& text);
    
    // Strict YYYY-MM-DD, used for configuration values
    static std::optional<CalendarDate> parse_iso_date(const std::string& text);
    
    // strptime-style patterns tried in order before the ISO-8601 fallback
    static const std::vector<std::string>& known_formats();
    
private:
    static std::optional<CalendarDate> try_format(const std::string& text,
                                                  const std::string& format);
    static std::optional<CalendarDate> parse_iso8601(const std::string& text);
};

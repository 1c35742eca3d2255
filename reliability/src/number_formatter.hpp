#pragma once

#include <string>
#include <optional>

// Fixed-precision display strings for report values. Missing or
// non-finite input always renders as NOT_AVAILABLE; nothing here throws.
class NumberFormatter {
public:
    static constexpr const char* NOT_AVAILABLE = "N/A";
    
    // Values with |v| <= 1 are taken as fractions and scaled by 100, so a
    // genuine 1% and a fractional 1.0 (100%) cannot be told apart.
    static std::string format_percent(std::optional<double> value, int decimals = 2,
                                      bool assume_fractional = false);
    static std::string format_ratio(std::optional<double> value, int decimals = 2);
    static std::string format_currency(std::optional<double> value);
    static std::string format_integer(std::optional<double> value);
    
private:
    static bool is_displayable(const std::optional<double>& value);
    static int clamp_decimals(int decimals);
};

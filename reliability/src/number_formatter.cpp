#include "number_formatter.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

bool NumberFormatter::is_displayable(const std::optional<double>& value) {
    return value.has_value() && std::isfinite(*value);
}

int NumberFormatter::clamp_decimals(int decimals) {
    return std::max(decimals, 0);
}

std::string NumberFormatter::format_percent(std::optional<double> value, int decimals,
                                            bool assume_fractional) {
    if (!is_displayable(value)) return NOT_AVAILABLE;
    
    double v = *value;
    if (assume_fractional || std::fabs(v) <= 1.0) {
        v *= 100.0;
    }
    return fmt::format("{:.{}f}%", v, clamp_decimals(decimals));
}

std::string NumberFormatter::format_ratio(std::optional<double> value, int decimals) {
    if (!is_displayable(value)) return NOT_AVAILABLE;
    return fmt::format("{:.{}f}", *value, clamp_decimals(decimals));
}

std::string NumberFormatter::format_currency(std::optional<double> value) {
    if (!is_displayable(value)) return NOT_AVAILABLE;
    return "$" + util::group_thousands(fmt::format("{:.2f}", *value));
}

std::string NumberFormatter::format_integer(std::optional<double> value) {
    if (!is_displayable(value)) return NOT_AVAILABLE;
    
    // Half away from zero; avoid "-0" for small negatives
    double rounded = std::round(*value);
    if (rounded == 0.0) rounded = 0.0;
    return util::group_thousands(fmt::format("{:.0f}", rounded));
}

#pragma once

#include <string>
#include <optional>

class ValueSanitizer {
public:
    // Normalizes an ambiguous dividend yield to a fraction in [0, 0.25].
    // Values above 1 are read as percents; anything implausible is discarded.
    static std::optional<double> sanitize_dividend_yield(std::optional<double> raw);
    
    static std::string article_snippet(const std::optional<std::string>& content,
                                       size_t max_length = DEFAULT_SNIPPET_LENGTH);
    static std::string trend_label(const std::optional<std::string>& trend);
    
    static constexpr size_t DEFAULT_SNIPPET_LENGTH = 240;
    static constexpr double MAX_DIVIDEND_YIELD = 0.25;
    
private:
    static constexpr double CORRUPT_YIELD_THRESHOLD = 1000.0;
    static constexpr double MAX_PERCENT_YIELD = 50.0;
};

#include "sanitizer.hpp"
#include "number_formatter.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <cmath>

std::optional<double> ValueSanitizer::sanitize_dividend_yield(std::optional<double> raw) {
    if (!raw.has_value() || !std::isfinite(*raw) || *raw < 0.0) {
        return std::nullopt;
    }
    
    double value = *raw;
    if (value > CORRUPT_YIELD_THRESHOLD) {
        spdlog::debug("Discarding corrupted dividend yield {}", value);
        return std::nullopt;
    }
    if (value > MAX_PERCENT_YIELD) {
        spdlog::debug("Discarding implausible dividend yield {}", value);
        return std::nullopt;
    }
    if (value > 1.0) {
        double normalized = value / 100.0;
        if (normalized > MAX_DIVIDEND_YIELD) {
            spdlog::debug("Discarding dividend yield {}% above cap", value);
            return std::nullopt;
        }
        return normalized;
    }
    
    return value;
}

std::string ValueSanitizer::article_snippet(const std::optional<std::string>& content,
                                            size_t max_length) {
    if (!content) return "";
    
    std::string snippet = util::trim(*content);
    if (snippet.length() <= max_length) return snippet;
    
    size_t keep = max_length > 3 ? max_length - 3 : 0;
    snippet = snippet.substr(0, keep);
    snippet.erase(snippet.find_last_not_of(" \t\n\r\f\v") + 1);
    return snippet + "...";
}

std::string ValueSanitizer::trend_label(const std::optional<std::string>& trend) {
    if (!trend) return NumberFormatter::NOT_AVAILABLE;
    
    std::string label = util::trim(*trend);
    if (label.empty()) return NumberFormatter::NOT_AVAILABLE;
    
    bool word_start = true;
    for (auto& c : label) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            c = static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc));
            word_start = false;
        } else {
            word_start = true;
        }
    }
    return label;
}

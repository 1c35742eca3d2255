#pragma once

#include "types.hpp"
#include <optional>

// Hard market-plausibility bounds. A record failing any check is untrusted
// as a whole; missing fields fail the check.
class RecordValidator {
public:
    static bool is_price_analysis_reliable(const std::optional<PriceAnalysis>& record);
    static bool is_valid_volatility_metrics(const std::optional<VolatilityMetrics>& record);
    
    static constexpr double MAX_ABS_TOTAL_RETURN_PCT = 400.0;
    static constexpr double MAX_PRICE_VOLATILITY_PCT = 200.0;
    static constexpr double MAX_HISTORICAL_VOLATILITY_PCT = 250.0;
    static constexpr double MIN_MAX_DRAWDOWN_PCT = -100.0;
    
private:
    static bool is_number(const std::optional<double>& value);
};

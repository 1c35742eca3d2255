#include "validator.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

bool RecordValidator::is_number(const std::optional<double>& value) {
    return value.has_value() && std::isfinite(*value);
}

bool RecordValidator::is_price_analysis_reliable(const std::optional<PriceAnalysis>& record) {
    if (!record) return false;
    const PriceAnalysis& pa = *record;
    
    if (!is_number(pa.total_return_percent) ||
        std::fabs(*pa.total_return_percent) > MAX_ABS_TOTAL_RETURN_PCT) {
        spdlog::debug("Price analysis rejected: total return missing or beyond +/-{}%",
                      MAX_ABS_TOTAL_RETURN_PCT);
        return false;
    }
    if (!is_number(pa.volatility) || *pa.volatility < 0.0 ||
        *pa.volatility > MAX_PRICE_VOLATILITY_PCT) {
        spdlog::debug("Price analysis rejected: volatility missing or outside [0, {}]",
                      MAX_PRICE_VOLATILITY_PCT);
        return false;
    }
    if (!is_number(pa.min_price) || !is_number(pa.max_price) ||
        *pa.min_price <= 0.0 || *pa.max_price <= 0.0) {
        spdlog::debug("Price analysis rejected: price bounds missing or non-positive");
        return false;
    }
    if (*pa.min_price >= *pa.max_price) {
        spdlog::debug("Price analysis rejected: min price {} >= max price {}",
                      *pa.min_price, *pa.max_price);
        return false;
    }
    if (!is_number(pa.average_volume) || *pa.average_volume <= 0.0) {
        spdlog::debug("Price analysis rejected: average volume missing or non-positive");
        return false;
    }
    
    return true;
}

bool RecordValidator::is_valid_volatility_metrics(const std::optional<VolatilityMetrics>& record) {
    if (!record) return false;
    const VolatilityMetrics& vm = *record;
    
    if (!is_number(vm.historical_volatility) || *vm.historical_volatility < 0.0 ||
        *vm.historical_volatility > MAX_HISTORICAL_VOLATILITY_PCT) {
        spdlog::debug("Volatility metrics rejected: historical volatility missing or outside [0, {}]",
                      MAX_HISTORICAL_VOLATILITY_PCT);
        return false;
    }
    if (!is_number(vm.max_drawdown) || *vm.max_drawdown > 0.0 ||
        *vm.max_drawdown < MIN_MAX_DRAWDOWN_PCT) {
        spdlog::debug("Volatility metrics rejected: max drawdown missing or outside [{}, 0]",
                      MIN_MAX_DRAWDOWN_PCT);
        return false;
    }
    
    return true;
}

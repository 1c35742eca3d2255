#pragma once

#include "config.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>

// Per-ticker JSON digest: validator verdicts, formatted values and the
// recency-filtered collections that downstream report writers consume.
class DigestBuilder {
public:
    explicit DigestBuilder(const Config& config);
    
    nlohmann::json build(const TickerBundle& bundle) const;
    
private:
    Config config_;
    
    nlohmann::json build_price_section(const std::optional<PriceAnalysis>& pa) const;
    nlohmann::json build_fundamentals_section(const FundamentalAnalysis& fa) const;
    nlohmann::json build_technical_section(const TechnicalAnalysis& ta) const;
    nlohmann::json build_market_comparison_section(const MarketComparison& mc) const;
    nlohmann::json build_activity_summary_section(const ActivitySummary& summary) const;
    nlohmann::json build_volatility_section(const std::optional<VolatilityMetrics>& vm) const;
    nlohmann::json build_news_section(const NewsReport& report) const;
    nlohmann::json build_insider_section(const InsiderReport& report) const;
    
    size_t item_limit() const;
};

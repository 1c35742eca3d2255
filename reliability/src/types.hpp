#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

// Records produced by the analysis agents. Every field may be missing, so
// each one is an explicit optional and decoding never throws.

struct PriceAnalysis {
    std::optional<double> total_return_percent;
    std::optional<double> volatility;
    std::optional<double> min_price;
    std::optional<double> max_price;
    std::optional<double> average_volume;
    std::optional<std::string> trend_direction;
    
    static PriceAnalysis from_json(const nlohmann::json& j);
};

struct FundamentalAnalysis {
    std::optional<double> pe_ratio;
    std::optional<double> forward_pe_ratio;
    std::optional<double> peg_ratio;
    std::optional<double> price_to_book;
    std::optional<double> dividend_yield;  // unit unknown: fraction, percent or garbage
    std::optional<double> fifty_two_week_high;
    std::optional<double> fifty_two_week_low;
    
    static FundamentalAnalysis from_json(const nlohmann::json& j);
};

struct TechnicalAnalysis {
    std::optional<double> sma_20;
    std::optional<double> sma_50;
    std::optional<double> rsi;
    std::optional<double> support_level;
    std::optional<double> resistance_level;
    
    static TechnicalAnalysis from_json(const nlohmann::json& j);
};

struct MarketComparison {
    std::optional<std::string> benchmark_ticker;
    std::optional<double> outperformance_percent;
    std::optional<double> beta;
    std::optional<double> correlation;
    std::optional<std::string> relative_strength;
    
    static MarketComparison from_json(const nlohmann::json& j);
};

struct VolatilityMetrics {
    std::optional<double> historical_volatility;
    std::optional<double> max_drawdown;
    
    // Advisory, not validated
    std::optional<double> beta;
    std::optional<double> sharpe_ratio;
    std::optional<std::string> volatility_regime;
    
    static VolatilityMetrics from_json(const nlohmann::json& j);
};

struct Article {
    std::optional<std::string> title;
    std::optional<std::string> source;
    std::optional<std::string> content;
    std::optional<std::string> published_date;
    
    static Article from_json(const nlohmann::json& j);
};

struct InsiderTransaction {
    std::optional<std::string> name;
    std::optional<std::string> title;
    std::optional<std::string> transaction_type;
    std::optional<double> shares;
    std::optional<double> price;
    std::optional<double> value;
    std::optional<std::string> transaction_date;
    
    static InsiderTransaction from_json(const nlohmann::json& j);
};

struct ActivitySummary {
    std::optional<double> total_buy_volume;
    std::optional<double> total_sell_volume;
    std::optional<double> net_insider_activity;
    std::vector<std::string> key_insiders;
    std::optional<std::string> activity_trend;
    
    static ActivitySummary from_json(const nlohmann::json& j);
};

struct HistoricalReport {
    std::optional<PriceAnalysis> price_analysis;
    std::optional<FundamentalAnalysis> fundamental_analysis;
    std::optional<TechnicalAnalysis> technical_analysis;
    std::optional<MarketComparison> market_comparison;
    
    static HistoricalReport from_json(const nlohmann::json& j);
};

struct VolatilityReport {
    std::optional<VolatilityMetrics> metrics;
    
    static VolatilityReport from_json(const nlohmann::json& j);
};

struct NewsReport {
    std::vector<Article> articles;
    
    static NewsReport from_json(const nlohmann::json& j);
};

struct InsiderReport {
    std::vector<InsiderTransaction> recent_transactions;
    std::optional<ActivitySummary> activity_summary;
    
    static InsiderReport from_json(const nlohmann::json& j);
};

// All agent outputs gathered for one ticker
struct TickerBundle {
    std::string ticker;
    std::optional<HistoricalReport> historical;
    std::optional<VolatilityReport> volatility;
    std::optional<NewsReport> news;
    std::optional<InsiderReport> insider;
    
    static TickerBundle from_json(const nlohmann::json& j);
};

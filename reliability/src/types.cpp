#include "types.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

// Present, non-null object member; anything else is treated as absent
const nlohmann::json* object_member(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) return nullptr;
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return nullptr;
    return &(*it);
}

template <typename Record>
std::vector<Record> decode_list(const nlohmann::json& j, const char* key) {
    std::vector<Record> records;
    if (!j.is_object()) return records;
    
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return records;
    if (!it->is_array()) {
        spdlog::warn("Field '{}' is not an array, ignoring", key);
        return records;
    }
    
    for (const auto& item : *it) {
        if (!item.is_object()) {
            spdlog::debug("Skipping non-object entry in '{}'", key);
            continue;
        }
        records.push_back(Record::from_json(item));
    }
    return records;
}

template <typename Record>
std::optional<Record> decode_member(const nlohmann::json& j, const char* key) {
    const nlohmann::json* member = object_member(j, key);
    if (!member) return std::nullopt;
    return Record::from_json(*member);
}

} // namespace

PriceAnalysis PriceAnalysis::from_json(const nlohmann::json& j) {
    PriceAnalysis pa;
    pa.total_return_percent = util::number_field(j, "total_return_percent");
    pa.volatility = util::number_field(j, "volatility");
    pa.min_price = util::number_field(j, "min_price");
    pa.max_price = util::number_field(j, "max_price");
    pa.average_volume = util::number_field(j, "average_volume");
    pa.trend_direction = util::string_field(j, "trend_direction");
    return pa;
}

FundamentalAnalysis FundamentalAnalysis::from_json(const nlohmann::json& j) {
    FundamentalAnalysis fa;
    fa.pe_ratio = util::number_field(j, "pe_ratio");
    fa.forward_pe_ratio = util::number_field(j, "forward_pe_ratio");
    fa.peg_ratio = util::number_field(j, "peg_ratio");
    fa.price_to_book = util::number_field(j, "price_to_book");
    fa.dividend_yield = util::number_field(j, "dividend_yield");
    fa.fifty_two_week_high = util::number_field(j, "fifty_two_week_high");
    fa.fifty_two_week_low = util::number_field(j, "fifty_two_week_low");
    return fa;
}

TechnicalAnalysis TechnicalAnalysis::from_json(const nlohmann::json& j) {
    TechnicalAnalysis ta;
    ta.sma_20 = util::number_field(j, "sma_20");
    ta.sma_50 = util::number_field(j, "sma_50");
    ta.rsi = util::number_field(j, "rsi");
    ta.support_level = util::number_field(j, "support_level");
    ta.resistance_level = util::number_field(j, "resistance_level");
    return ta;
}

MarketComparison MarketComparison::from_json(const nlohmann::json& j) {
    MarketComparison mc;
    mc.benchmark_ticker = util::string_field(j, "benchmark_ticker");
    mc.outperformance_percent = util::number_field(j, "outperformance_percent");
    mc.beta = util::number_field(j, "beta");
    mc.correlation = util::number_field(j, "correlation");
    mc.relative_strength = util::string_field(j, "relative_strength");
    return mc;
}

VolatilityMetrics VolatilityMetrics::from_json(const nlohmann::json& j) {
    VolatilityMetrics vm;
    vm.historical_volatility = util::number_field(j, "historical_volatility");
    vm.max_drawdown = util::number_field(j, "max_drawdown");
    vm.beta = util::number_field(j, "beta");
    vm.sharpe_ratio = util::number_field(j, "sharpe_ratio");
    vm.volatility_regime = util::string_field(j, "volatility_regime");
    return vm;
}

Article Article::from_json(const nlohmann::json& j) {
    Article article;
    article.title = util::string_field(j, "title");
    article.source = util::string_field(j, "source");
    article.content = util::string_field(j, "content");
    article.published_date = util::string_field(j, "published_date");
    return article;
}

InsiderTransaction InsiderTransaction::from_json(const nlohmann::json& j) {
    InsiderTransaction txn;
    txn.name = util::string_field(j, "name");
    txn.title = util::string_field(j, "title");
    txn.transaction_type = util::string_field(j, "transaction_type");
    txn.shares = util::number_field(j, "shares");
    txn.price = util::number_field(j, "price");
    txn.value = util::number_field(j, "value");
    txn.transaction_date = util::string_field(j, "transaction_date");
    return txn;
}

ActivitySummary ActivitySummary::from_json(const nlohmann::json& j) {
    ActivitySummary summary;
    summary.total_buy_volume = util::number_field(j, "total_buy_volume");
    summary.total_sell_volume = util::number_field(j, "total_sell_volume");
    summary.net_insider_activity = util::number_field(j, "net_insider_activity");
    summary.key_insiders = util::string_list_field(j, "key_insiders");
    summary.activity_trend = util::string_field(j, "activity_trend");
    return summary;
}

HistoricalReport HistoricalReport::from_json(const nlohmann::json& j) {
    HistoricalReport report;
    report.price_analysis = decode_member<PriceAnalysis>(j, "price_analysis");
    report.fundamental_analysis = decode_member<FundamentalAnalysis>(j, "fundamental_analysis");
    report.technical_analysis = decode_member<TechnicalAnalysis>(j, "technical_analysis");
    report.market_comparison = decode_member<MarketComparison>(j, "market_comparison");
    return report;
}

VolatilityReport VolatilityReport::from_json(const nlohmann::json& j) {
    VolatilityReport report;
    report.metrics = decode_member<VolatilityMetrics>(j, "metrics");
    return report;
}

NewsReport NewsReport::from_json(const nlohmann::json& j) {
    NewsReport report;
    report.articles = decode_list<Article>(j, "articles");
    return report;
}

InsiderReport InsiderReport::from_json(const nlohmann::json& j) {
    InsiderReport report;
    report.recent_transactions = decode_list<InsiderTransaction>(j, "recent_transactions");
    report.activity_summary = decode_member<ActivitySummary>(j, "activity_summary");
    return report;
}

TickerBundle TickerBundle::from_json(const nlohmann::json& j) {
    TickerBundle bundle;
    
    try {
        bundle.ticker = util::string_field(j, "ticker").value_or("UNKNOWN");
        bundle.historical = decode_member<HistoricalReport>(j, "historical");
        bundle.volatility = decode_member<VolatilityReport>(j, "volatility");
        bundle.news = decode_member<NewsReport>(j, "news");
        bundle.insider = decode_member<InsiderReport>(j, "insider");
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Failed to decode bundle for {}: {}", bundle.ticker, e.what());
    }
    
    return bundle;
}

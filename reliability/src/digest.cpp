#include "digest.hpp"
#include "number_formatter.hpp"
#include "sanitizer.hpp"
#include "validator.hpp"
#include "recency_filter.hpp"
#include <spdlog/spdlog.h>

DigestBuilder::DigestBuilder(const Config& config) : config_(config) {}

size_t DigestBuilder::item_limit() const {
    return config_.max_items_per_section > 0
        ? static_cast<size_t>(config_.max_items_per_section) : 0;
}

nlohmann::json DigestBuilder::build(const TickerBundle& bundle) const {
    nlohmann::json digest;
    digest["ticker"] = bundle.ticker;
    digest["as_of"] = config_.as_of_date.to_iso_string();
    
    digest["price_analysis"] = nullptr;
    digest["fundamentals"] = nullptr;
    digest["technical"] = nullptr;
    digest["market_comparison"] = nullptr;
    if (bundle.historical) {
        const HistoricalReport& historical = *bundle.historical;
        digest["price_analysis"] = build_price_section(historical.price_analysis);
        if (historical.fundamental_analysis) {
            digest["fundamentals"] = build_fundamentals_section(*historical.fundamental_analysis);
        }
        if (historical.technical_analysis) {
            digest["technical"] = build_technical_section(*historical.technical_analysis);
        }
        if (historical.market_comparison) {
            digest["market_comparison"] = build_market_comparison_section(
                *historical.market_comparison);
        }
    }
    
    digest["volatility"] = bundle.volatility
        ? build_volatility_section(bundle.volatility->metrics) : nlohmann::json();
    digest["news"] = bundle.news
        ? build_news_section(*bundle.news) : nlohmann::json();
    digest["insider"] = bundle.insider
        ? build_insider_section(*bundle.insider) : nlohmann::json();
    
    spdlog::info("Digest built for {}: price={}, volatility={}",
                 bundle.ticker,
                 digest["price_analysis"].is_object() && digest["price_analysis"]["reliable"].get<bool>()
                     ? "reliable" : "unavailable",
                 digest["volatility"].is_object() && digest["volatility"]["valid"].get<bool>()
                     ? "valid" : "unavailable");
    
    return digest;
}

nlohmann::json DigestBuilder::build_price_section(const std::optional<PriceAnalysis>& pa) const {
    nlohmann::json section;
    section["reliable"] = RecordValidator::is_price_analysis_reliable(pa);
    if (!section["reliable"].get<bool>()) {
        return section;
    }
    
    section["total_return"] = NumberFormatter::format_percent(pa->total_return_percent);
    section["volatility"] = NumberFormatter::format_percent(pa->volatility);
    section["price_range"] = {
        NumberFormatter::format_currency(pa->min_price),
        NumberFormatter::format_currency(pa->max_price)
    };
    section["average_volume"] = NumberFormatter::format_integer(pa->average_volume);
    section["trend"] = ValueSanitizer::trend_label(pa->trend_direction);
    return section;
}

nlohmann::json DigestBuilder::build_fundamentals_section(const FundamentalAnalysis& fa) const {
    auto dividend = ValueSanitizer::sanitize_dividend_yield(fa.dividend_yield);
    
    return {
        {"pe_ratio", NumberFormatter::format_ratio(fa.pe_ratio)},
        {"forward_pe_ratio", NumberFormatter::format_ratio(fa.forward_pe_ratio)},
        {"peg_ratio", NumberFormatter::format_ratio(fa.peg_ratio)},
        {"price_to_book", NumberFormatter::format_ratio(fa.price_to_book)},
        {"dividend_yield", NumberFormatter::format_percent(dividend, 2, true)},
        {"fifty_two_week_high", NumberFormatter::format_currency(fa.fifty_two_week_high)},
        {"fifty_two_week_low", NumberFormatter::format_currency(fa.fifty_two_week_low)}
    };
}

nlohmann::json DigestBuilder::build_technical_section(const TechnicalAnalysis& ta) const {
    return {
        {"sma_20", NumberFormatter::format_currency(ta.sma_20)},
        {"sma_50", NumberFormatter::format_currency(ta.sma_50)},
        {"rsi", NumberFormatter::format_ratio(ta.rsi)},
        {"support_level", NumberFormatter::format_currency(ta.support_level)},
        {"resistance_level", NumberFormatter::format_currency(ta.resistance_level)}
    };
}

nlohmann::json DigestBuilder::build_market_comparison_section(const MarketComparison& mc) const {
    return {
        {"benchmark", mc.benchmark_ticker.value_or(NumberFormatter::NOT_AVAILABLE)},
        {"outperformance", NumberFormatter::format_percent(mc.outperformance_percent)},
        {"beta", NumberFormatter::format_ratio(mc.beta)},
        {"correlation", NumberFormatter::format_ratio(mc.correlation, 4)},
        {"relative_strength", mc.relative_strength.value_or(NumberFormatter::NOT_AVAILABLE)}
    };
}

nlohmann::json DigestBuilder::build_activity_summary_section(const ActivitySummary& summary) const {
    nlohmann::json insiders = nlohmann::json::array();
    for (size_t i = 0; i < summary.key_insiders.size() && i < item_limit(); i++) {
        insiders.push_back(summary.key_insiders[i]);
    }
    
    return {
        {"total_buy_volume", NumberFormatter::format_integer(summary.total_buy_volume)},
        {"total_sell_volume", NumberFormatter::format_integer(summary.total_sell_volume)},
        {"net_insider_activity", NumberFormatter::format_currency(summary.net_insider_activity)},
        {"key_insiders", insiders},
        {"trend", summary.activity_trend.value_or(NumberFormatter::NOT_AVAILABLE)}
    };
}

nlohmann::json DigestBuilder::build_volatility_section(
    const std::optional<VolatilityMetrics>& vm) const {
    
    nlohmann::json section;
    section["valid"] = RecordValidator::is_valid_volatility_metrics(vm);
    if (!section["valid"].get<bool>()) {
        return section;
    }
    
    section["historical_volatility"] = NumberFormatter::format_percent(vm->historical_volatility);
    section["beta"] = NumberFormatter::format_ratio(vm->beta);
    section["sharpe_ratio"] = NumberFormatter::format_ratio(vm->sharpe_ratio);
    section["max_drawdown"] = NumberFormatter::format_percent(vm->max_drawdown);
    section["regime"] = vm->volatility_regime.value_or(NumberFormatter::NOT_AVAILABLE);
    return section;
}

nlohmann::json DigestBuilder::build_news_section(const NewsReport& report) const {
    auto recent = RecencyFilter::filter_recent_articles(
        report.articles, config_.as_of_date, config_.article_max_age_days);
    
    nlohmann::json articles = nlohmann::json::array();
    for (size_t i = 0; i < recent.size() && i < item_limit(); i++) {
        const Article& article = recent[i];
        articles.push_back({
            {"title", article.title.value_or(NumberFormatter::NOT_AVAILABLE)},
            {"source", article.source.value_or(NumberFormatter::NOT_AVAILABLE)},
            {"published_date", article.published_date.value_or("")},
            {"snippet", ValueSanitizer::article_snippet(article.content)}
        });
    }
    
    return {
        {"received", report.articles.size()},
        {"recent", recent.size()},
        {"articles", articles}
    };
}

nlohmann::json DigestBuilder::build_insider_section(const InsiderReport& report) const {
    auto recent = RecencyFilter::filter_recent_transactions(
        report.recent_transactions, config_.as_of_date,
        config_.transaction_max_age_days, config_.placeholder_names);
    
    nlohmann::json transactions = nlohmann::json::array();
    for (size_t i = 0; i < recent.size() && i < item_limit(); i++) {
        const InsiderTransaction& txn = recent[i];
        transactions.push_back({
            {"name", txn.name.value_or("")},
            {"title", txn.title.value_or(NumberFormatter::NOT_AVAILABLE)},
            {"type", txn.transaction_type.value_or(NumberFormatter::NOT_AVAILABLE)},
            {"shares", NumberFormatter::format_integer(txn.shares)},
            {"price", NumberFormatter::format_currency(txn.price)},
            {"value", NumberFormatter::format_currency(txn.value)},
            {"transaction_date", txn.transaction_date.value_or("")}
        });
    }
    
    return {
        {"received", report.recent_transactions.size()},
        {"recent", recent.size()},
        {"transactions", transactions},
        {"activity_summary", report.activity_summary
            ? build_activity_summary_section(*report.activity_summary) : nlohmann::json()}
    };
}

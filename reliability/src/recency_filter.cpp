#include "recency_filter.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

const PlaceholderNames& RecencyFilter::default_placeholder_names() {
    static const PlaceholderNames names = {
        "john doe",
        "jane smith",
        "alice johnson"
    };
    return names;
}

bool RecencyFilter::is_placeholder_name(const std::optional<std::string>& name,
                                        const PlaceholderNames& placeholders) {
    if (!name) return true;
    std::string normalized = util::to_lower(util::trim(*name));
    if (normalized.empty()) return true;
    if (placeholders.count(normalized) > 0) return true;
    
    // Caller-supplied sets may carry entries in any case or spacing
    for (const auto& entry : placeholders) {
        if (util::to_lower(util::trim(entry)) == normalized) return true;
    }
    return false;
}

bool RecencyFilter::is_within_window(const std::optional<std::string>& timestamp,
                                     const CalendarDate& as_of, int max_age_days) {
    if (!timestamp) return false;
    
    auto date = DateParser::parse(*timestamp);
    if (!date) {
        spdlog::debug("Dropping record with unparseable date '{}'", *timestamp);
        return false;
    }
    
    int64_t age_days = as_of.days_since_epoch() - date->days_since_epoch();
    if (age_days > max_age_days) {
        spdlog::debug("Dropping record dated {} ({} days before {})",
                      date->to_iso_string(), age_days, as_of.to_iso_string());
        return false;
    }
    return true;
}

std::vector<Article> RecencyFilter::filter_recent_articles(const std::vector<Article>& articles,
                                                           const CalendarDate& as_of,
                                                           int max_age_days) {
    std::vector<Article> recent;
    for (const auto& article : articles) {
        if (is_within_window(article.published_date, as_of, max_age_days)) {
            recent.push_back(article);
        }
    }
    
    spdlog::debug("Kept {} of {} articles within {} days of {}",
                  recent.size(), articles.size(), max_age_days, as_of.to_iso_string());
    return recent;
}

std::vector<InsiderTransaction> RecencyFilter::filter_valid_transactions(
    const std::vector<InsiderTransaction>& transactions,
    const PlaceholderNames& placeholders) {
    
    std::vector<InsiderTransaction> valid;
    for (const auto& txn : transactions) {
        if (is_placeholder_name(txn.name, placeholders)) {
            spdlog::debug("Dropping transaction with placeholder insider '{}'",
                          txn.name.value_or(""));
            continue;
        }
        valid.push_back(txn);
    }
    return valid;
}

std::vector<InsiderTransaction> RecencyFilter::filter_recent_transactions(
    const std::vector<InsiderTransaction>& transactions,
    const CalendarDate& as_of,
    int max_age_days,
    const PlaceholderNames& placeholders) {
    
    std::vector<InsiderTransaction> recent;
    for (const auto& txn : filter_valid_transactions(transactions, placeholders)) {
        if (is_within_window(txn.transaction_date, as_of, max_age_days)) {
            recent.push_back(txn);
        }
    }
    
    spdlog::debug("Kept {} of {} insider transactions within {} days of {}",
                  recent.size(), transactions.size(), max_age_days, as_of.to_iso_string());
    return recent;
}

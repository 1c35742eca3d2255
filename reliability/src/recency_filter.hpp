#pragma once

#include "types.hpp"
#include "date_parser.hpp"
#include <set>
#include <string>
#include <vector>

using PlaceholderNames = std::set<std::string>;

// Recency-window selection over time-stamped agent records. Input order is
// preserved, undated records are dropped, and filtering is idempotent.
class RecencyFilter {
public:
    static constexpr int DEFAULT_ARTICLE_MAX_AGE_DAYS = 120;
    static constexpr int DEFAULT_TRANSACTION_MAX_AGE_DAYS = 365;
    
    static std::vector<Article> filter_recent_articles(
        const std::vector<Article>& articles,
        const CalendarDate& as_of,
        int max_age_days = DEFAULT_ARTICLE_MAX_AGE_DAYS);
    
    // Drops transactions with an empty or placeholder insider name
    static std::vector<InsiderTransaction> filter_valid_transactions(
        const std::vector<InsiderTransaction>& transactions,
        const PlaceholderNames& placeholders = default_placeholder_names());
    
    static std::vector<InsiderTransaction> filter_recent_transactions(
        const std::vector<InsiderTransaction>& transactions,
        const CalendarDate& as_of,
        int max_age_days = DEFAULT_TRANSACTION_MAX_AGE_DAYS,
        const PlaceholderNames& placeholders = default_placeholder_names());
    
    // Lower-cased filler identities the agents are known to invent
    static const PlaceholderNames& default_placeholder_names();
    
    // Missing, blank or listed names; entries match case-insensitively after trimming
    static bool is_placeholder_name(const std::optional<std::string>& name,
                                    const PlaceholderNames& placeholders);
    
    // True when the timestamp parses and is at most max_age_days before as_of
    static bool is_within_window(const std::optional<std::string>& timestamp,
                                 const CalendarDate& as_of, int max_age_days);
};

#pragma once

#include "date_parser.hpp"
#include "recency_filter.hpp"
#include <string>
#include <cstdlib>

struct Config {
    // Report reference date
    CalendarDate as_of_date;
    
    // Recency windows (days)
    int article_max_age_days;
    int transaction_max_age_days;
    
    // Digest limits
    int max_items_per_section;
    
    // Built-in placeholder names plus EXTRA_PLACEHOLDER_NAMES
    PlaceholderNames placeholder_names;
    
    // Service
    std::string service_name;
    std::string log_level;
    
    static Config from_env();
    void validate() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static CalendarDate resolve_as_of_date(const std::string& override_value);
};

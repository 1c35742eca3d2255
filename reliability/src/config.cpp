#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        size_t consumed = 0;
        int parsed = std::stoi(val, &consumed);
        if (consumed != std::string(val).length()) {
            throw std::invalid_argument(val);
        }
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

CalendarDate Config::resolve_as_of_date(const std::string& override_value) {
    if (!override_value.empty()) {
        if (auto date = DateParser::parse_iso_date(util::trim(override_value))) {
            return *date;
        }
        spdlog::warn("REPORT_AS_OF_DATE '{}' is invalid; using today's date instead",
                     override_value);
    }
    return CalendarDate::today_utc();
}

Config Config::from_env() {
    Config cfg;
    
    cfg.as_of_date = resolve_as_of_date(get_env("REPORT_AS_OF_DATE"));
    
    cfg.article_max_age_days = get_env_int("ARTICLE_MAX_AGE_DAYS",
                                           RecencyFilter::DEFAULT_ARTICLE_MAX_AGE_DAYS);
    cfg.transaction_max_age_days = get_env_int("TRANSACTION_MAX_AGE_DAYS",
                                               RecencyFilter::DEFAULT_TRANSACTION_MAX_AGE_DAYS);
    cfg.max_items_per_section = get_env_int("MAX_ITEMS_PER_SECTION", 3);
    
    cfg.placeholder_names = RecencyFilter::default_placeholder_names();
    for (const auto& name : util::split(get_env("EXTRA_PLACEHOLDER_NAMES"), ',')) {
        cfg.placeholder_names.insert(util::to_lower(name));
    }
    
    cfg.service_name = get_env("SERVICE_NAME", "reliability");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

void Config::validate() const {
    if (article_max_age_days < 0) {
        throw std::runtime_error("ARTICLE_MAX_AGE_DAYS must not be negative");
    }
    if (transaction_max_age_days < 0) {
        throw std::runtime_error("TRANSACTION_MAX_AGE_DAYS must not be negative");
    }
    if (max_items_per_section < 0) {
        throw std::runtime_error("MAX_ITEMS_PER_SECTION must not be negative");
    }
    
    spdlog::info("Configuration validated successfully");
    spdlog::info("  As of: {}", as_of_date.to_iso_string());
    spdlog::info("  Windows: articles={}d, transactions={}d",
                 article_max_age_days, transaction_max_age_days);
    spdlog::info("  Placeholder names: {}", placeholder_names.size());
}

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace util {
    std::string trim(const std::string& str);
    std::string to_lower(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    
    // Inserts ',' every three digits of the integer part ("-1234.50" -> "-1,234.50")
    std::string group_thousands(const std::string& fixed);
    
    std::optional<double> parse_number(const std::string& text);
    std::optional<double> coerce_number(const nlohmann::json& value);
    std::optional<double> number_field(const nlohmann::json& obj, const char* key);
    std::optional<std::string> string_field(const nlohmann::json& obj, const char* key);
    // String elements of an array field; other elements are skipped
    std::vector<std::string> string_list_field(const nlohmann::json& obj, const char* key);
}

#include "util.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cerrno>

namespace util {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string group_thousands(const std::string& fixed) {
    size_t digits_begin = (!fixed.empty() && (fixed[0] == '-' || fixed[0] == '+')) ? 1 : 0;
    size_t digits_end = fixed.find('.');
    if (digits_end == std::string::npos) digits_end = fixed.length();
    
    std::string grouped = fixed.substr(0, digits_begin);
    size_t count = digits_end - digits_begin;
    for (size_t i = 0; i < count; i++) {
        grouped += fixed[digits_begin + i];
        size_t remaining = count - i - 1;
        if (remaining > 0 && remaining % 3 == 0) {
            grouped += ',';
        }
    }
    grouped += fixed.substr(digits_end);
    return grouped;
}

std::optional<double> parse_number(const std::string& text) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) return std::nullopt;
    // strtod would also take hex floats
    if (trimmed.find_first_of("xX") != std::string::npos) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.length() || errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> coerce_number(const nlohmann::json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return parse_number(value.get<std::string>());
    }
    // null, bool, object and array are not numbers
    return std::nullopt;
}

std::optional<double> number_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    return coerce_number(*it);
}

std::optional<std::string> string_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::vector<std::string> string_list_field(const nlohmann::json& obj, const char* key) {
    std::vector<std::string> values;
    if (!obj.is_object()) return values;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) return values;
    for (const auto& item : *it) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

} // namespace util

/**
 * @file Parse.cpp
 * @brief Implementation of string typing
 */

#include "patcher/Parse.hpp"
#include "patcher/Util.hpp"

#include <regex>
#include <stdexcept>

namespace patcher {

namespace {
    /**
     * @brief Check if string matches regex pattern
     */
    bool matches_regex(const std::string& str, const std::regex& re) {
        return std::regex_match(str, re);
    }

    const std::regex& integer_pattern() {
        static const std::regex re("^-?[0-9]+$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
        return re;
    }
}

Value parse_value(const std::string& str) {
    // Empty string stays a string
    if (str.empty()) {
        return "";
    }

    // Boolean
    const std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }

    // Null
    if (lower == "null") {
        return nullptr;
    }

    // Integer
    // Pattern: ^-?[0-9]+$
    if (matches_regex(str, integer_pattern())) {
        try {
            size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<std::int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // Out of int64 range: fall through to the string rules
        }
    }

    // Float
    // Pattern: ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$
    if (matches_regex(str, float_pattern())) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
            // Overflows double: fall through
        }
    }

    // JSON compound (objects and arrays)
    const bool compound = (str.front() == '{' && str.back() == '}') ||
                          (str.front() == '[' && str.back() == ']');
    if (compound) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    // Quoted string (handles escapes)
    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_string()) {
            return parsed;
        }
    }

    // Raw string (fallback)
    return str;
}

} // namespace patcher

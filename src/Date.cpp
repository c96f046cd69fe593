/**
 * @file Date.cpp
 * @brief Implementation of ISO date parsing
 */

#include "patcher/Date.hpp"
#include <cctype>
#include <cstdio>
#include <regex>

namespace patcher {

namespace {
    bool is_leap_year(int year) {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    int days_in_month(int year, int month) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2 && is_leap_year(year)) return 29;
        return days[month - 1];
    }

    /**
     * @brief Read exactly `count` digits starting at `pos`
     */
    bool read_digits(const std::string& text, size_t pos, size_t count, int& out) {
        if (pos + count > text.size()) return false;
        int value = 0;
        for (size_t i = pos; i < pos + count; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
            value = value * 10 + (text[i] - '0');
        }
        out = value;
        return true;
    }

    /**
     * @brief Validate the part after the date: separator, HH:MM[:SS[.frac]]
     *        and an optional Z or +HH:MM offset
     */
    bool valid_time_suffix(const std::string& suffix) {
        static const std::regex re(
            "^[Tt ]([0-9]{2}):([0-9]{2})(:([0-9]{2})(\\.[0-9]+)?)?"
            "([Zz]|[+-]([0-9]{2}):([0-9]{2}))?$");
        std::smatch m;
        if (!std::regex_match(suffix, m, re)) return false;

        if (std::stoi(m[1].str()) > 23 || std::stoi(m[2].str()) > 59) return false;
        // 60 allows a leap second
        if (m[4].matched && std::stoi(m[4].str()) > 60) return false;
        if (m[7].matched && (std::stoi(m[7].str()) > 23 || std::stoi(m[8].str()) > 59)) {
            return false;
        }
        return true;
    }
}

std::optional<Date> parse_date(const std::string& text) {
    // YYYY-MM-DD is exactly 10 characters
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    Date date;
    if (!read_digits(text, 0, 4, date.year) ||
        !read_digits(text, 5, 2, date.month) ||
        !read_digits(text, 8, 2, date.day)) {
        return std::nullopt;
    }

    if (text.size() > 10 && !valid_time_suffix(text.substr(10))) {
        return std::nullopt;
    }

    if (date.month < 1 || date.month > 12) return std::nullopt;
    if (date.day < 1 || date.day > days_in_month(date.year, date.month)) return std::nullopt;

    return date;
}

std::string to_string(const Date& date) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month, date.day);
    return buf;
}

} // namespace patcher

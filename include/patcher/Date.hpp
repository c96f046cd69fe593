/**
 * @file Date.hpp
 * @brief Calendar date leaf type
 *
 * JSON has no date type and the TOML loader renders dates as ISO strings,
 * so a Date field is patched from a "YYYY-MM-DD" string. A trailing time
 * part ("T..." or " ...") is accepted and dropped.
 */

#ifndef PATCHER_DATE_HPP
#define PATCHER_DATE_HPP

#include <optional>
#include <string>

namespace patcher {

/**
 * @brief Proleptic Gregorian calendar date
 */
struct Date {
    int year = 1;
    int month = 1;
    int day = 1;

    bool operator==(const Date& other) const noexcept {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date& other) const noexcept { return !(*this == other); }
};

/**
 * @brief Parse an ISO-8601 calendar date
 *
 * @param text "YYYY-MM-DD", optionally followed by 'T', 't' or ' ' and a
 *             time "HH:MM[:SS[.fraction]]" with an optional "Z" or
 *             "+HH:MM"/"-HH:MM" offset. A valid time is checked and then
 *             dropped.
 * @return The date, or nullopt if text is malformed or names a day that
 *         does not exist (e.g., "2023-02-29")
 *
 * Examples:
 * ```cpp
 * parse_date("1980-01-01")            // → Date{1980, 1, 1}
 * parse_date("2024-02-29T10:00:00Z")  // → Date{2024, 2, 29}
 * parse_date("1980-13-01")            // → nullopt
 * parse_date("01/01/1980")            // → nullopt
 * parse_date("2020-01-01Tgarbage")    // → nullopt
 * ```
 */
std::optional<Date> parse_date(const std::string& text);

/**
 * @brief Format as "YYYY-MM-DD"
 */
std::string to_string(const Date& date);

} // namespace patcher

#endif // PATCHER_DATE_HPP

/**
 * @file Parse.hpp
 * @brief String-to-Value typing for environment variables and CLI
 *        assignments
 *
 * Rules, first match wins:
 * - Boolean ("true", "false", case-insensitive)
 * - Null ("null", case-insensitive)
 * - Integer (-?[0-9]+ that fits in int64)
 * - Float (-?[0-9]+.[0-9]+ with optional exponent)
 * - JSON compound ({...} or [...] that parses)
 * - Quoted string ("..." that parses as a JSON string)
 * - Raw string (fallback)
 */

#ifndef PATCHER_PARSE_HPP
#define PATCHER_PARSE_HPP

#include "patcher/Value.hpp"
#include <string>

namespace patcher {

/**
 * @brief Parse string value to appropriate type
 *
 * Examples:
 * ```cpp
 * parse_value("TRUE")       // → true (boolean)
 * parse_value("null")       // → null
 * parse_value("-17")        // → -17 (integer)
 * parse_value("2.5e3")      // → 2500.0 (float)
 * parse_value("[1,2]")      // → [1, 2] (array)
 * parse_value("\"007\"")    // → "007" (string, unquoted)
 * parse_value("1980-01-01") // → "1980-01-01" (string)
 * ```
 */
Value parse_value(const std::string& str);

} // namespace patcher

#endif // PATCHER_PARSE_HPP

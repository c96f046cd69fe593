/**
 * @file Value.hpp
 * @brief Document and scalar leaf types
 *
 * The source document is an nlohmann::json value. The patch engine never
 * works on it directly: every top-level member is normalized to a Scalar,
 * a closed tagged variant of the leaf kinds a decoder can produce:
 * - Null
 * - Bool (true | false)
 * - Integer (always int64_t, the widest signed width)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Nested (object or array, kept opaque)
 */

#ifndef PATCHER_VALUE_HPP
#define PATCHER_VALUE_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <variant>

namespace patcher {

/**
 * @brief Dynamic source document
 *
 * Alias for nlohmann::json. Only JSON objects are accepted as patch sources.
 */
using Document = nlohmann::json;

/**
 * @brief Generic JSON-like value used by the configuration layer
 */
using Value = nlohmann::json;

/**
 * @brief Explicit null leaf
 */
struct Null {
    bool operator==(const Null&) const noexcept { return true; }
    bool operator!=(const Null&) const noexcept { return false; }
};

/**
 * @brief Opaque nested object or array
 *
 * Nested values are carried through extraction untouched. No destination
 * type accepts them.
 */
struct Nested {
    Document value;

    bool operator==(const Nested& other) const { return value == other.value; }
    bool operator!=(const Nested& other) const { return !(*this == other); }
};

/**
 * @brief Tagged leaf value extracted from a source document
 */
using Scalar = std::variant<Null, bool, std::int64_t, double, std::string, Nested>;

/**
 * @brief Get human-readable type name for a Document
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Document& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Get human-readable kind name for a Scalar
 * @return One of "null", "boolean", "integer", "float", "string", "nested"
 */
std::string kind_name(const Scalar& val);

/**
 * @brief Normalize one document member to a Scalar
 *
 * Signed and unsigned integers both become int64_t. Unsigned values above
 * INT64_MAX wrap. Objects and arrays become Nested.
 */
Scalar to_scalar(const Document& val);

/**
 * @brief Check whether a Scalar holds Null
 */
inline bool is_null(const Scalar& val) noexcept {
    return std::holds_alternative<Null>(val);
}

} // namespace patcher

#endif // PATCHER_VALUE_HPP

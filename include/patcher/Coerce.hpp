/**
 * @file Coerce.hpp
 * @brief Destination field types and Scalar-to-field conversion
 *
 * Every destination member type maps to a FieldType at compile time.
 * Admissible types are the scalar leaves:
 * - std::string
 * - bool
 * - every signed and unsigned integer width
 * - float, double
 * - Date
 * - std::optional of any of the above
 *
 * Containers map to FieldType::sequence. Every other type (records,
 * enums, pointers) maps to FieldType::composite. Both are inadmissible.
 *
 * Conversion rules:
 * - Integer fields take an integer scalar narrowed with static_cast. There
 *   is no range check; out-of-range values wrap modulo 2^N.
 * - Floating fields take a float scalar or an integer scalar.
 * - String, bool and Date fields take a string, bool and ISO date string
 *   respectively.
 * - Null clears a std::optional field and is rejected everywhere else.
 */

#ifndef PATCHER_COERCE_HPP
#define PATCHER_COERCE_HPP

#include "patcher/Value.hpp"
#include "patcher/Date.hpp"
#include "patcher/Errors.hpp"

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace patcher {

/**
 * @brief Declared type of a destination field
 */
enum class FieldType : std::uint8_t {
    string,
    boolean,
    int8,
    int16,
    int32,
    int64,
    uint8,
    uint16,
    uint32,
    uint64,
    float32,
    float64,
    date,
    sequence,
    composite,
};

/**
 * @brief Lowercase name of a FieldType (e.g., "int32", "sequence")
 */
std::string to_string(FieldType type);

/**
 * @brief Name of a field type including nullability (e.g., "optional<int32>")
 */
std::string field_type_name(FieldType type, bool nullable);

/**
 * @brief True for every FieldType except sequence and composite
 */
constexpr bool is_admissible(FieldType type) noexcept {
    return type != FieldType::sequence && type != FieldType::composite;
}

namespace detail {

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T, typename = void>
struct is_range : std::false_type {};

template <typename T>
struct is_range<T, std::void_t<decltype(std::begin(std::declval<T&>())),
                               decltype(std::end(std::declval<T&>()))>>
    : std::true_type {};

template <typename T>
constexpr FieldType integer_type() noexcept {
    if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) return FieldType::int8;
        else if constexpr (sizeof(T) == 2) return FieldType::int16;
        else if constexpr (sizeof(T) == 4) return FieldType::int32;
        else return FieldType::int64;
    } else {
        if constexpr (sizeof(T) == 1) return FieldType::uint8;
        else if constexpr (sizeof(T) == 2) return FieldType::uint16;
        else if constexpr (sizeof(T) == 4) return FieldType::uint32;
        else return FieldType::uint64;
    }
}

template <typename T>
constexpr FieldType classify() noexcept {
    if constexpr (std::is_same_v<T, std::string>) return FieldType::string;
    else if constexpr (std::is_same_v<T, bool>) return FieldType::boolean;
    else if constexpr (std::is_same_v<T, Date>) return FieldType::date;
    else if constexpr (std::is_integral_v<T>) return integer_type<T>();
    else if constexpr (std::is_same_v<T, float>) return FieldType::float32;
    else if constexpr (std::is_floating_point_v<T>) return FieldType::float64;
    else if constexpr (is_range<T>::value) return FieldType::sequence;
    else return FieldType::composite;
}

} // namespace detail

/**
 * @brief Compile-time description of a destination member type
 */
template <typename T>
struct FieldTraits {
    static constexpr FieldType type = detail::classify<T>();
    static constexpr bool nullable = false;
};

template <typename T>
struct FieldTraits<std::optional<T>> {
    static constexpr FieldType type = detail::classify<T>();
    static constexpr bool nullable = true;
};

/**
 * @brief True if a member of type T can be patched
 */
template <typename T>
constexpr bool is_admissible_type = is_admissible(FieldTraits<T>::type);

/**
 * @brief Narrow a document integer to an integer field width
 *
 * Plain static_cast: values outside the range of T wrap modulo 2^N.
 *
 * Examples:
 * ```cpp
 * narrow<std::int8_t>(100)     // → 100
 * narrow<std::int8_t>(200)     // → -56
 * narrow<std::int16_t>(70000)  // → 4464
 * narrow<std::uint8_t>(-1)     // → 255
 * ```
 */
template <typename T>
constexpr T narrow(std::int64_t value) noexcept {
    static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>,
                  "narrow() targets integer types only");
    return static_cast<T>(value);
}

namespace detail {

template <typename T>
T convert_leaf(const Scalar& value, const std::string& field) {
    constexpr FieldType type = FieldTraits<T>::type;

    if constexpr (type == FieldType::string) {
        if (const auto* s = std::get_if<std::string>(&value)) return *s;
    } else if constexpr (type == FieldType::boolean) {
        if (const auto* b = std::get_if<bool>(&value)) return *b;
    } else if constexpr (type == FieldType::date) {
        if (const auto* s = std::get_if<std::string>(&value)) {
            if (auto date = parse_date(*s)) return *date;
            throw IncompatibleValue(field, to_string(type), "malformed date string");
        }
    } else if constexpr (std::is_integral_v<T>) {
        if (const auto* i = std::get_if<std::int64_t>(&value)) return narrow<T>(*i);
    } else if constexpr (std::is_floating_point_v<T>) {
        if (const auto* d = std::get_if<double>(&value)) return static_cast<T>(*d);
        if (const auto* i = std::get_if<std::int64_t>(&value)) return static_cast<T>(*i);
    }

    throw IncompatibleValue(field, to_string(type), kind_name(value));
}

} // namespace detail

/**
 * @brief Convert a Scalar to the type of a destination field
 *
 * @tparam T Admissible member type
 * @param value Extracted source value
 * @param field Destination field name, used in error messages
 * @throws NullNotAllowed if value is Null and T is not std::optional
 * @throws IncompatibleValue if the scalar kind does not fit T
 */
template <typename T>
T coerce(const Scalar& value, const std::string& field) {
    static_assert(is_admissible_type<T>, "coerce() requires an admissible field type");

    if constexpr (detail::is_optional<T>::value) {
        if (is_null(value)) return std::nullopt;
        return T(detail::convert_leaf<typename T::value_type>(value, field));
    } else {
        if (is_null(value)) {
            throw NullNotAllowed(field, to_string(FieldTraits<T>::type));
        }
        return detail::convert_leaf<T>(value, field);
    }
}

} // namespace patcher

#endif // PATCHER_COERCE_HPP

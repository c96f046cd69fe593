/**
 * @file Value.cpp
 * @brief Scalar normalization
 */

#include "patcher/Value.hpp"

namespace patcher {

std::string kind_name(const Scalar& val) {
    switch (val.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "float";
        case 4: return "string";
        case 5: return "nested";
    }
    return "unknown";
}

Scalar to_scalar(const Document& val) {
    switch (val.type()) {
        case Document::value_t::null:
            return Null{};

        case Document::value_t::boolean:
            return val.get<bool>();

        case Document::value_t::number_integer:
            return val.get<std::int64_t>();

        // Widest signed width; values above INT64_MAX wrap
        case Document::value_t::number_unsigned:
            return static_cast<std::int64_t>(val.get<std::uint64_t>());

        case Document::value_t::number_float:
            return val.get<double>();

        case Document::value_t::string:
            return val.get<std::string>();

        default:
            return Nested{val};
    }
}

} // namespace patcher

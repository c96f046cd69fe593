/**
 * @file Coerce.cpp
 * @brief Field type names
 */

#include "patcher/Coerce.hpp"

namespace patcher {

std::string to_string(FieldType type) {
    switch (type) {
        case FieldType::string:    return "string";
        case FieldType::boolean:   return "boolean";
        case FieldType::int8:      return "int8";
        case FieldType::int16:     return "int16";
        case FieldType::int32:     return "int32";
        case FieldType::int64:     return "int64";
        case FieldType::uint8:     return "uint8";
        case FieldType::uint16:    return "uint16";
        case FieldType::uint32:    return "uint32";
        case FieldType::uint64:    return "uint64";
        case FieldType::float32:   return "float32";
        case FieldType::float64:   return "float64";
        case FieldType::date:      return "date";
        case FieldType::sequence:  return "sequence";
        case FieldType::composite: return "composite";
    }
    return "unknown";
}

std::string field_type_name(FieldType type, bool nullable) {
    if (nullable) {
        return "optional<" + to_string(type) + ">";
    }
    return to_string(type);
}

} // namespace patcher

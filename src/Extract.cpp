/**
 * @file Extract.cpp
 * @brief Implementation of source field extraction
 */

#include "patcher/Extract.hpp"
#include "patcher/Errors.hpp"

namespace patcher {

std::vector<SourceField> extract_fields(const Document& source) {
    if (source.is_null()) {
        throw InvalidArgument("source");
    }
    if (!source.is_object()) {
        throw TypeMismatch(type_name(source));
    }

    std::vector<SourceField> fields;
    fields.reserve(source.size());
    for (auto it = source.begin(); it != source.end(); ++it) {
        fields.push_back(SourceField{it.key(), to_scalar(it.value())});
    }
    return fields;
}

std::vector<SourceField> extract_fields(const Document* source) {
    if (source == nullptr) {
        throw InvalidArgument("source");
    }
    return extract_fields(*source);
}

} // namespace patcher

/**
 * @file Patcher.cpp
 * @brief Field matching, unknown-field gate and write loop
 */

#include "patcher/Patcher.hpp"
#include "patcher/Util.hpp"

#include <set>

namespace patcher {

namespace {
    /**
     * @brief Source names with no destination field, in document order
     */
    std::vector<std::string> unknown_names(const std::vector<SourceField>& fields,
                                           const TypeDescriptor& type,
                                           bool ignore_case) {
        std::set<std::string> known;
        for (const auto& fd : type.fields()) {
            known.insert(name_key(fd.name, ignore_case));
        }

        std::vector<std::string> unknown;
        for (const auto& field : fields) {
            if (known.count(name_key(field.name, ignore_case)) == 0) {
                unknown.push_back(field.name);
            }
        }
        return unknown;
    }

    /**
     * @brief Resolve the destination field for one source member
     *
     * @return nullptr if nothing matches
     * @throws AmbiguousField, NotWritable, UnsupportedFieldType
     */
    const FieldDescriptor* resolve(const SourceField& field, const TypeDescriptor& type,
                                   bool ignore_case) {
        auto matches = type.find(field.name, ignore_case);
        if (matches.empty()) {
            return nullptr;
        }
        if (matches.size() > 1) {
            throw AmbiguousField(field.name, type.name());
        }

        const FieldDescriptor* fd = matches.front();
        if (!fd->settable) {
            throw NotWritable(fd->name, type.name());
        }
        if (!fd->admissible()) {
            throw UnsupportedFieldType(fd->name, fd->type_name());
        }
        return fd;
    }
}

void apply_fields(const std::vector<SourceField>& fields, void* object,
                  const TypeDescriptor& type, const PatchOptions& options) {
    if (object == nullptr) {
        throw InvalidArgument("destination");
    }

    if (!options.ignore_unknown_properties) {
        auto unknown = unknown_names(fields, type, options.ignore_case);
        if (!unknown.empty()) {
            throw UnknownSourceField(type.name(), std::move(unknown));
        }
    }

    if (options.validate_before_write) {
        for (const auto& field : fields) {
            if (const FieldDescriptor* fd = resolve(field, type, options.ignore_case)) {
                fd->check(field.value);
            }
        }
    }

    for (const auto& field : fields) {
        if (const FieldDescriptor* fd = resolve(field, type, options.ignore_case)) {
            fd->assign(object, field.value);
        }
    }
}

} // namespace patcher

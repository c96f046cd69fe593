/**
 * @file Fields.cpp
 * @brief Field lookup by name
 */

#include "patcher/Fields.hpp"
#include "patcher/Util.hpp"

namespace patcher {

std::vector<const FieldDescriptor*> TypeDescriptor::find(const std::string& name,
                                                         bool ignore_case) const {
    std::vector<const FieldDescriptor*> matches;
    for (const auto& fd : fields_) {
        if (names_equal(fd.name, name, ignore_case)) {
            matches.push_back(&fd);
        }
    }
    return matches;
}

} // namespace patcher

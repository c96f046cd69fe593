/**
 * @file Inspect.hpp
 * @brief Destination field inspection
 *
 * Resolves the field table and object address of a destination. For
 * Patchable types both come from the most-derived type, so a Derived object
 * patched through a Base& exposes Derived's fields. Every other type uses
 * its static type's table.
 */

#ifndef PATCHER_INSPECT_HPP
#define PATCHER_INSPECT_HPP

#include "patcher/Fields.hpp"
#include <memory>
#include <type_traits>

namespace patcher {

/**
 * @brief Field table of the destination's concrete type
 */
template <typename T>
const TypeDescriptor& inspect(const T& destination) {
    if constexpr (std::is_base_of_v<Patchable, T>) {
        return destination.patch_type();
    } else {
        return describe<T>();
    }
}

/**
 * @brief Address matching the table returned by inspect()
 */
template <typename T>
void* object_address(T& destination) {
    if constexpr (std::is_base_of_v<Patchable, T>) {
        return dynamic_cast<void*>(std::addressof(destination));
    } else {
        return static_cast<void*>(std::addressof(destination));
    }
}

} // namespace patcher

#endif // PATCHER_INSPECT_HPP

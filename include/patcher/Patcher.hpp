/**
 * @file Patcher.hpp
 * @brief Apply a sparse JSON document onto a typed object
 *
 * patch() copies every top-level member of a JSON object onto the
 * destination field of the same name and leaves all other fields alone.
 *
 * Order of checks:
 * 1. source and destination present (InvalidArgument), source is an
 *    object (TypeMismatch)
 * 2. unless ignore_unknown_properties, every source name must match a
 *    destination field (UnknownSourceField). Nothing is written if not.
 * 3. per field, in document order: ambiguous match (AmbiguousField),
 *    read-only (NotWritable), non-scalar type (UnsupportedFieldType),
 *    value conversion (NullNotAllowed, IncompatibleValue), then write.
 *
 * Step 3 is not transactional. A failure on one field leaves the fields
 * written before it in place. Set validate_before_write to run every step 3
 * check before the first write.
 *
 * patch() keeps no reference to either argument. Concurrent calls on the
 * same destination must be serialized by the caller.
 */

#ifndef PATCHER_PATCHER_HPP
#define PATCHER_PATCHER_HPP

#include "patcher/Errors.hpp"
#include "patcher/Extract.hpp"
#include "patcher/Fields.hpp"
#include "patcher/Inspect.hpp"
#include "patcher/Options.hpp"
#include "patcher/Value.hpp"

#include <vector>

namespace patcher {

/**
 * @brief Type-erased engine behind patch()
 *
 * @param fields Extracted source members
 * @param object Address of the destination, as returned by object_address()
 * @param type Field table matching object
 * @param options Matching and unknown-field policy
 */
void apply_fields(const std::vector<SourceField>& fields, void* object,
                  const TypeDescriptor& type, const PatchOptions& options);

/**
 * @brief Patch destination with the members of source
 *
 * Examples:
 * ```cpp
 * Employee e{"Steve", "Stevenson", 2};
 * patch(Document{{"firstname", "Tommy"}}, e);
 * // e = {"Tommy", "Stevenson", 2}
 *
 * patch(Document{{"MiddleName", "Hank"}}, e);
 * // Throws UnknownSourceField, e unchanged
 *
 * PatchOptions lenient;
 * lenient.ignore_unknown_properties = true;
 * patch(Document{{"MiddleName", "Hank"}, {"LastName", "Tomorrow"}}, e, lenient);
 * // e = {"Tommy", "Tomorrow", 2}
 * ```
 */
template <typename T>
void patch(const Document& source, T& destination, const PatchOptions& options = PatchOptions{}) {
    const auto fields = extract_fields(source);
    apply_fields(fields, object_address(destination), inspect(destination), options);
}

/**
 * @brief Pointer overload; a null source or destination throws
 *        InvalidArgument
 */
template <typename T>
void patch(const Document* source, T* destination, const PatchOptions& options = PatchOptions{}) {
    if (source == nullptr) {
        throw InvalidArgument("source");
    }
    if (destination == nullptr) {
        throw InvalidArgument("destination");
    }
    patch(*source, *destination, options);
}

} // namespace patcher

#endif // PATCHER_PATCHER_HPP

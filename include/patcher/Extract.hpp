/**
 * @file Extract.hpp
 * @brief Source field extraction
 *
 * Turns a patch document into an ordered list of (name, Scalar) pairs.
 * Only the top level is read; nested objects and arrays are carried as
 * opaque Nested scalars.
 */

#ifndef PATCHER_EXTRACT_HPP
#define PATCHER_EXTRACT_HPP

#include "patcher/Value.hpp"
#include <string>
#include <vector>

namespace patcher {

/**
 * @brief One top-level member of a patch document
 */
struct SourceField {
    std::string name;
    Scalar value;
};

/**
 * @brief Extract the top-level members of a patch document
 *
 * @param source Patch document; must be a JSON object
 * @return Members in the document's iteration order
 * @throws InvalidArgument if source is null
 * @throws TypeMismatch if source is not an object
 *
 * Examples:
 * ```cpp
 * Document doc = {{"FirstName", "Tommy"}, {"Dependents", 3}};
 * auto fields = extract_fields(doc);
 * // fields[0] = {"Dependents", int64_t{3}}
 * // fields[1] = {"FirstName", std::string{"Tommy"}}
 *
 * extract_fields(Document::array());  // Throws TypeMismatch
 * ```
 */
std::vector<SourceField> extract_fields(const Document& source);

/**
 * @brief Pointer overload; nullptr throws InvalidArgument
 */
std::vector<SourceField> extract_fields(const Document* source);

} // namespace patcher

#endif // PATCHER_EXTRACT_HPP

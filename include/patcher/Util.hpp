#ifndef PATCHER_UTIL_HPP
#define PATCHER_UTIL_HPP

#include <string>
#include <utility>
#include <vector>

namespace patcher {

// ASCII-only case mapping for keywords, extensions and env-var names.
std::string to_lower(std::string s);
std::string to_upper(std::string s);

// Unicode simple case folding of each UTF-8 code point, no locale.
// Ill-formed bytes are kept as they are.
std::string fold_case(const std::string& s);

// Ordinal comparison; with ignoreCase, both sides are compared after
// fold_case().
bool names_equal(const std::string& a, const std::string& b, bool ignoreCase);

// Key used to compare names under the case policy.
std::string name_key(const std::string& name, bool ignoreCase);

// Strip ASCII whitespace from both ends.
std::string trim(const std::string& s);

// Join with ", ".
std::string join(const std::vector<std::string>& parts);

// Parse a "name=value" assignment. Returns false if there is no '=' or the
// name is empty.
bool split_assignment(const std::string& s, std::pair<std::string, std::string>& out);

} // namespace patcher

#endif // PATCHER_UTIL_HPP

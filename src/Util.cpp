/**
 * @file Util.cpp
 * @brief Name comparison and string helpers
 *
 * Case-insensitive name matching folds each UTF-8 code point with ICU's
 * simple case folding (locale independent).
 */

#include "patcher/Util.hpp"
#include <algorithm>
#include <cstdint>
#include <sstream>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace patcher {

namespace {
    char ascii_lower(char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    char ascii_upper(char c) {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    }

    bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ascii_lower);
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ascii_upper);
    return s;
}

std::string fold_case(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    const auto* bytes = reinterpret_cast<const std::uint8_t*>(s.data());
    const auto length = static_cast<std::int32_t>(s.size());
    std::int32_t i = 0;
    while (i < length) {
        const std::int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c < 0) {
            // Ill-formed sequence: copied through unchanged
            out.append(s, static_cast<size_t>(start), static_cast<size_t>(i - start));
            continue;
        }

        c = u_foldCase(c, U_FOLD_CASE_DEFAULT);
        std::uint8_t buf[U8_MAX_LENGTH];
        std::int32_t n = 0;
        U8_APPEND_UNSAFE(buf, n, c);
        out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(n));
    }
    return out;
}

bool names_equal(const std::string& a, const std::string& b, bool ignoreCase) {
    if (a == b) return true;
    if (!ignoreCase) return false;
    return fold_case(a) == fold_case(b);
}

std::string name_key(const std::string& name, bool ignoreCase) {
    return ignoreCase ? fold_case(name) : name;
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && is_space(s[i])) ++i;
    while (j > i && is_space(s[j - 1])) --j;
    return s.substr(i, j - i);
}

std::string join(const std::vector<std::string>& parts) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) oss << ", ";
        oss << parts[i];
    }
    return oss.str();
}

bool split_assignment(const std::string& s, std::pair<std::string, std::string>& out) {
    auto pos = s.find('=');
    if (pos == std::string::npos) return false;
    std::string name = trim(s.substr(0, pos));
    if (name.empty()) return false;
    out.first = name;
    out.second = s.substr(pos + 1);
    return true;
}

} // namespace patcher

/**
 * @file Options.hpp
 * @brief Patch options and their layered loading
 *
 * Options are read with the precedence
 *   defaults -> file (JSON/TOML) -> environment (prefix) -> overrides
 * where later layers win key by key.
 *
 * Recognized keys:
 * - ignore_case (default true)
 * - ignore_unknown_properties (default false)
 * - validate_before_write (default false)
 */

#ifndef PATCHER_OPTIONS_HPP
#define PATCHER_OPTIONS_HPP

#include "patcher/Value.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace patcher {

/**
 * @brief Matching and unknown-field policy for patch()
 */
struct PatchOptions {
    /// Match names after Unicode simple case folding.
    bool ignore_case = true;

    /// Skip source members with no destination field instead of failing.
    bool ignore_unknown_properties = false;

    /// Run every per-field check before the first write.
    bool validate_before_write = false;

    /**
     * @brief Read options from an object; absent keys keep their defaults
     *
     * @throws ConfigError if value is not an object, has an unknown key,
     *         or holds a non-boolean
     */
    static PatchOptions from_value(const Value& value);

    /**
     * @brief All three keys as a JSON object
     */
    Value to_value() const;
};

/**
 * @brief Names of the recognized option keys
 */
const std::vector<std::string>& option_keys();

/**
 * @brief Inputs for load_options()
 */
struct OptionSources {
    Value defaults = Value::object();
    std::optional<std::string> file_path;
    std::optional<std::string> env_prefix; // e.g. "PATCHER"
    std::map<std::string, Value> overrides;
};

/**
 * @brief Collect options from environment variables
 *
 * For prefix "PATCHER", reads PATCHER_IGNORE_CASE,
 * PATCHER_IGNORE_UNKNOWN_PROPERTIES and PATCHER_VALIDATE_BEFORE_WRITE.
 * Values are typed with parse_value().
 *
 * @return Object holding only the variables that are set
 */
Value collect_env_options(const std::string& prefix);

/**
 * @brief Read options from a JSON or TOML file
 *
 * A top-level "patch" object holds the options if present; otherwise the
 * root object does.
 *
 * @throws FileNotFoundError, DocumentParseError, ConfigError
 */
Value read_options_file(const std::string& path);

/**
 * @brief Merge all layers and build PatchOptions
 */
PatchOptions load_options(const OptionSources& sources);

} // namespace patcher

#endif // PATCHER_OPTIONS_HPP

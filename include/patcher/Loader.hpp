/**
 * @file Loader.hpp
 * @brief Document loading utilities
 *
 * Decodes patch documents and option files from:
 * - JSON text and files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * TOML dates, times and date-times are rendered as ISO-8601 strings so
 * they can be patched into Date fields.
 */

#ifndef PATCHER_LOADER_HPP
#define PATCHER_LOADER_HPP

#include "patcher/Value.hpp"
#include <optional>
#include <string>

namespace patcher {

// ============================================================================
// JSON
// ============================================================================

/**
 * @brief Parse JSON text into a Document
 *
 * @param text JSON text
 * @param origin Name used in error messages
 * @throws DocumentParseError if the text is not valid JSON
 */
Document parse_document(const std::string& text, const std::string& origin = "<string>");

/**
 * @brief Load a JSON file
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
Document load_json_file(const std::string& path);

// ============================================================================
// TOML
// ============================================================================

/**
 * @brief Parse TOML text into a Document
 *
 * @throws DocumentParseError if TOML syntax is invalid
 */
Document parse_toml(const std::string& text, const std::string& origin = "<string>");

/**
 * @brief Load a TOML file
 *
 * TOML tables map to nested objects.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
Document load_toml_file(const std::string& path);

// ============================================================================
// Auto-detect
// ============================================================================

/**
 * @brief Load a document, picking the format by extension
 *
 * ".json" -> JSON, ".toml" -> TOML.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if the file has syntax errors
 * @throws ConfigError if the extension is neither .json nor .toml
 */
Document load_document_file(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

/**
 * @brief Set environment variable.
 *
 * @param name Variable name
 * @param value Variable value
 * @param overwrite If true, overwrite existing; if false, only set if not exists
 * @return true if variable was set, false if existed and overwrite=false
 */
bool set_env_var(const std::string& name, const std::string& value, bool overwrite = true);

/**
 * @brief Remove environment variable.
 */
void unset_env_var(const std::string& name);

/**
 * @brief Get environment variable value.
 *
 * @param name Variable name
 * @return Value if exists, nullopt otherwise
 */
std::optional<std::string> get_env_var(const std::string& name);

} // namespace patcher

#endif // PATCHER_LOADER_HPP

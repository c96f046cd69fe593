/**
 * @file Loader.cpp
 * @brief Document loading implementation
 *
 * JSON through nlohmann::json, TOML through toml++. TOML values are
 * converted to the Document model: dates and times become ISO strings.
 */

#include "patcher/Loader.hpp"
#include "patcher/Errors.hpp"
#include "patcher/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>
#include <filesystem>
#include <cstdlib>

#ifdef _WIN32
    #include <windows.h>
#endif

namespace fs = std::filesystem;

namespace patcher {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

template <typename T>
std::string stream_to_string(const T& value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

/**
 * @brief Convert toml++ node to Document.
 */
Document toml_node_to_document(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Document(node.as_string()->get());

        case toml::node_type::integer:
            return Document(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Document(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Document(node.as_boolean()->get());

        case toml::node_type::date:
            return Document(stream_to_string(node.as_date()->get()));

        case toml::node_type::time:
            return Document(stream_to_string(node.as_time()->get()));

        case toml::node_type::date_time:
            return Document(stream_to_string(node.as_date_time()->get()));

        case toml::node_type::array: {
            Document arr = Document::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_node_to_document(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Document obj = Document::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_node_to_document(val);
            }
            return obj;
        }

        default:
            return Document(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// JSON
// ============================================================================

Document parse_document(const std::string& text, const std::string& origin) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw DocumentParseError(origin, 0, 0, e.what());
    }
}

Document load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_document(read_file(path), path);
}

// ============================================================================
// TOML
// ============================================================================

Document parse_toml(const std::string& text, const std::string& origin) {
    toml::table table;
    try {
        table = toml::parse(text, origin);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            origin,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
    return toml_node_to_document(table);
}

Document load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_toml(read_file(path), path);
}

// ============================================================================
// Auto-detect
// ============================================================================

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Document load_document_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw ConfigError("Unsupported document type: " + ext + " (expected .json or .toml)");
}

// ============================================================================
// Environment
// ============================================================================

bool set_env_var(const std::string& name, const std::string& value, bool overwrite) {
    if (!overwrite && get_env_var(name).has_value()) {
        return false;
    }

#ifdef _WIN32
    return SetEnvironmentVariableA(name.c_str(), value.c_str()) != 0;
#else
    return setenv(name.c_str(), value.c_str(), 1) == 0;
#endif
}

void unset_env_var(const std::string& name) {
#ifdef _WIN32
    SetEnvironmentVariableA(name.c_str(), nullptr);
#else
    unsetenv(name.c_str());
#endif
}

std::optional<std::string> get_env_var(const std::string& name) {
#ifdef _WIN32
    char buffer[32767];  // Max env var size on Windows
    DWORD result = GetEnvironmentVariableA(name.c_str(), buffer, sizeof(buffer));
    if (result == 0) {
        return std::nullopt;
    }
    return std::string(buffer, result);
#else
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
#endif
}

} // namespace patcher

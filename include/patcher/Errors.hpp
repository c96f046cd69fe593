/**
 * @file Errors.hpp
 * @brief Exception types for patch and configuration errors
 *
 * Patch errors (all derive from PatchError):
 * - InvalidArgument: source or destination absent
 * - TypeMismatch: source is not a JSON object
 * - UnknownSourceField: source names with no destination field (strict mode)
 * - NotWritable: matched destination field is read-only
 * - UnsupportedFieldType: matched destination field is a collection or
 *   nested composite
 * - AmbiguousField: more than one destination field matches a source name
 * - IncompatibleValue: scalar kind cannot be stored in the field type
 * - NullNotAllowed: null assigned to a non-optional field
 *
 * Configuration errors (all derive from ConfigError):
 * - FileNotFoundError: file not found
 * - DocumentParseError: JSON/TOML syntax errors
 */

#ifndef PATCHER_ERRORS_HPP
#define PATCHER_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace patcher {

/**
 * @brief Base class for all errors raised by patch()
 */
class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A required argument was absent
 */
class InvalidArgument : public PatchError {
public:
    /**
     * @param argument Name of the absent argument ("source" or "destination")
     */
    explicit InvalidArgument(std::string argument)
        : PatchError("Argument must not be null: " + argument)
        , argument_(std::move(argument))
    {}

    const std::string& argument() const noexcept {
        return argument_;
    }

private:
    std::string argument_;
};

/**
 * @brief The source is not a JSON object
 */
class TypeMismatch : public PatchError {
public:
    /**
     * @param actual Kind of the value that was supplied (e.g., "array")
     */
    explicit TypeMismatch(std::string actual)
        : PatchError("Patch source must be a JSON object, got " + actual)
        , actual_(std::move(actual))
    {}

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string actual_;
};

/**
 * @brief Source names with no matching destination field
 *
 * Raised before any field is written. Contains every offending name.
 */
class UnknownSourceField : public PatchError {
public:
    UnknownSourceField(std::string type_name, std::vector<std::string> names)
        : PatchError(format_message(type_name, names))
        , type_name_(std::move(type_name))
        , names_(std::move(names))
    {}

    const std::string& type_name() const noexcept {
        return type_name_;
    }

    /**
     * @brief Unknown source names in enumeration order
     */
    const std::vector<std::string>& names() const noexcept {
        return names_;
    }

private:
    std::string type_name_;
    std::vector<std::string> names_;

    static std::string format_message(const std::string& type_name,
                                      const std::vector<std::string>& names) {
        std::ostringstream oss;
        oss << "Source document has fields that are not present on destination type "
            << type_name << ". Unknown source field names: ";
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << names[i];
        }
        return oss.str();
    }
};

/**
 * @brief Common base for errors tied to one destination field
 */
class FieldError : public PatchError {
public:
    FieldError(const std::string& message, std::string field, std::string type_name)
        : PatchError(message)
        , field_(std::move(field))
        , type_name_(std::move(type_name))
    {}

    /**
     * @brief Destination field name
     */
    const std::string& field() const noexcept {
        return field_;
    }

    /**
     * @brief Destination type name for NotWritable and AmbiguousField,
     *        field type name for the others
     */
    const std::string& type_name() const noexcept {
        return type_name_;
    }

private:
    std::string field_;
    std::string type_name_;
};

/**
 * @brief The matched destination field cannot be assigned
 */
class NotWritable : public FieldError {
public:
    NotWritable(const std::string& field, const std::string& type_name)
        : FieldError("Cannot write to destination field " + field +
                     " of type " + type_name, field, type_name)
    {}
};

/**
 * @brief The matched destination field has a non-scalar type
 */
class UnsupportedFieldType : public FieldError {
public:
    UnsupportedFieldType(const std::string& field, const std::string& field_type)
        : FieldError("Destination field " + field + " has unsupported type " +
                     field_type + "; only scalar fields can be patched",
                     field, field_type)
    {}
};

/**
 * @brief Several destination fields match the same source name
 */
class AmbiguousField : public FieldError {
public:
    AmbiguousField(const std::string& field, const std::string& type_name)
        : FieldError("Source field " + field +
                     " matches more than one field of destination type " + type_name,
                     field, type_name)
    {}
};

/**
 * @brief The source value cannot be converted to the field type
 */
class IncompatibleValue : public FieldError {
public:
    IncompatibleValue(const std::string& field, const std::string& field_type,
                      std::string actual)
        : FieldError("Cannot assign " + actual + " value to destination field " +
                     field + " of type " + field_type, field, field_type)
        , actual_(std::move(actual))
    {}

    /**
     * @brief Kind of the offending source value
     */
    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string actual_;
};

/**
 * @brief Null assigned to a field that is not std::optional
 */
class NullNotAllowed : public FieldError {
public:
    NullNotAllowed(const std::string& field, const std::string& field_type)
        : FieldError("Cannot assign null to non-nullable destination field " +
                     field + " of type " + field_type, field, field_type)
    {}
};

/**
 * @brief Base class for configuration and loading errors
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief File not found
 */
class FileNotFoundError : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ConfigError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON/TOML syntax)
 */
class DocumentParseError : public ConfigError {
public:
    /**
     * @param file Path to the file with the error, or "<string>" for text
     * @param line 1-based line, 0 if unknown
     * @param column 1-based column, 0 if unknown
     * @param details Detailed error message from parser
     */
    DocumentParseError(std::string file, int line, int column, std::string details)
        : ConfigError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at line " << line;
            if (column > 0) oss << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

} // namespace patcher

#endif // PATCHER_ERRORS_HPP

/**
 * @file Errors.hpp
 * @brief Exception types raised by the decoder and loaders
 *
 * Error taxonomy:
 * - Error: Base class
 * - NotAddressable: Decode target is not a writable reference (fatal)
 * - ConfigurationError: Invalid field annotations on a registered type (fatal)
 * - DecodeError: Aggregated field-level errors of one decode call
 * - FileNotFoundError / ParseError / UnsupportedFormat: Source loading
 */

#ifndef MORPH_ERRORS_HPP
#define MORPH_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace morph {

/**
 * @brief Base class for all morph exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The caller handed a null or non-writable decode target
 */
class NotAddressable : public Error {
public:
    explicit NotAddressable(const std::string& type)
        : Error("result must be a non-null pointer, got null " + type)
    {}
};

/**
 * @brief Invalid annotations on a registered struct type
 *
 * Raised when the field layout of a type is built, independent of the
 * data being decoded. Always aborts the decode call.
 */
class ConfigurationError : public Error {
public:
    ConfigurationError(std::string type, std::string field, const std::string& reason)
        : Error(type + "." + field + ": " + reason)
        , type_(std::move(type))
        , field_(std::move(field))
    {}

    /**
     * @brief Name of the struct type carrying the bad annotation
     */
    const std::string& type() const noexcept {
        return type_;
    }

    /**
     * @brief Declared name of the offending field
     */
    const std::string& field() const noexcept {
        return field_;
    }

private:
    std::string type_;
    std::string field_;
};

/**
 * @brief `squash` on a field that is neither a struct nor a pointer to one
 */
class InvalidSquashTarget : public ConfigurationError {
public:
    InvalidSquashTarget(std::string type, std::string field, const std::string& field_type)
        : ConfigurationError(std::move(type), std::move(field),
                             "unsupported type for squash: " + field_type)
    {}
};

/**
 * @brief `remain` on a field that is not a mapping with string keys
 */
class InvalidRemainTarget : public ConfigurationError {
public:
    InvalidRemainTarget(std::string type, std::string field, const std::string& field_type)
        : ConfigurationError(std::move(type), std::move(field),
                             "remain field must be a mapping with string keys, got " + field_type)
    {}
};

/**
 * @brief More than one `remain` field in one struct
 */
class MultipleRemainFields : public ConfigurationError {
public:
    MultipleRemainFields(std::string type, std::string field)
        : ConfigurationError(std::move(type), std::move(field),
                             "only one remain field is allowed per struct")
    {}
};

/**
 * @brief Two fields of one struct declare the same name
 */
class DuplicateFieldName : public ConfigurationError {
public:
    DuplicateFieldName(std::string type, std::string field, const std::string& name)
        : ConfigurationError(std::move(type), std::move(field),
                             "duplicate declared name '" + name + "'")
    {}
};

/**
 * @brief Category of a field-level decode failure
 */
enum class ErrorKind {
    Unconvertible,
    ArrayLengthMismatch,
    UnusedKeys,
    UnsetFields,
    HookFailed
};

inline const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Unconvertible: return "Unconvertible";
        case ErrorKind::ArrayLengthMismatch: return "ArrayLengthMismatch";
        case ErrorKind::UnusedKeys: return "UnusedKeys";
        case ErrorKind::UnsetFields: return "UnsetFields";
        case ErrorKind::HookFailed: break;
    }
    return "HookFailed";
}

/**
 * @brief One failing location of a decode call
 */
struct FieldError {
    /// Dotted path of the failing location (e.g. "vbar.vstring", "items[2]")
    std::string path;
    ErrorKind kind = ErrorKind::Unconvertible;
    std::string message;
};

/**
 * @brief All field-level errors collected during one decode call
 *
 * The decoder never stops at the first failing field; every failure of
 * every nested location is listed here.
 */
class DecodeError : public Error {
public:
    explicit DecodeError(std::vector<FieldError> errors)
        : Error(format_message(errors))
        , errors_(std::move(errors))
    {}

    /**
     * @brief Get the individual field errors, in decode order
     */
    const std::vector<FieldError>& errors() const noexcept {
        return errors_;
    }

    /**
     * @brief Check whether some error at @p path has the given kind
     */
    bool has(const std::string& path, ErrorKind kind) const noexcept {
        for (const auto& err : errors_) {
            if (err.path == path && err.kind == kind) return true;
        }
        return false;
    }

private:
    std::vector<FieldError> errors_;

    static std::string format_message(const std::vector<FieldError>& errors) {
        std::ostringstream oss;
        oss << errors.size() << " error(s) decoding:\n";
        for (const auto& err : errors) {
            oss << "\n* " << err.message;
        }
        return oss.str();
    }
};

/**
 * @brief Source file not found
 */
class FileNotFoundError : public Error {
public:
    explicit FileNotFoundError(std::string path)
        : Error("Source file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Source file parse error (JSON/TOML syntax)
 */
class ParseError : public Error {
public:
    /**
     * @param file Path to the file (or "<string>")
     * @param line 1-based line, 0 if unknown
     * @param column 1-based column, 0 if unknown
     * @param details Message from the parser
     */
    ParseError(std::string file, int line, int column, std::string details)
        : Error(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

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

/**
 * @brief Source file with an extension no loader handles
 */
class UnsupportedFormat : public Error {
public:
    explicit UnsupportedFormat(const std::string& ext)
        : Error("Unsupported source file type: '" + ext + "' (expected .json or .toml)")
    {}
};

} // namespace morph

#endif // MORPH_ERRORS_HPP

/**
 * @file Errors.hpp
 * @brief Exception types for configuration merge errors
 *
 * Error taxonomy:
 * - MergeError: Base class, carries an ErrorKind
 * - PolicyConflictError: Same pattern declared overwrite and append
 * - OptionsError: Malformed merge options file
 * - LoadError: Document could not be read or parsed
 *   - FileNotFoundError, ParseError, UnsupportedFormatError
 * - TypeMismatchError: Key holds different structural types
 * - DuplicateKeyError: Scalar key repeated with a different value
 * - DocumentError: Any of the above, tagged with the failing document
 */

#ifndef CONFMERGE_ERRORS_HPP
#define CONFMERGE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace confmerge {

/**
 * @brief Category of a merge failure
 */
enum class ErrorKind {
    PolicyConflict,
    Configuration,
    Load,
    TypeMismatch,
    DuplicateKey
};

/**
 * @brief Get a short name for an error kind ("policy-conflict", ...)
 */
inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PolicyConflict: return "policy-conflict";
        case ErrorKind::Configuration:  return "configuration";
        case ErrorKind::Load:           return "load";
        case ErrorKind::TypeMismatch:   return "type-mismatch";
        case ErrorKind::DuplicateKey:   return "duplicate-key";
    }
    return "unknown";
}

/**
 * @brief Base class for all confmerge exceptions
 */
class MergeError : public std::runtime_error {
public:
    MergeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {}

    /**
     * @brief Get the category of this error
     */
    ErrorKind kind() const noexcept {
        return kind_;
    }

private:
    ErrorKind kind_;
};

/**
 * @brief The same normalized pattern is declared both overwrite and append
 *
 * Raised while building a MergePolicy, before any document is read.
 */
class PolicyConflictError : public MergeError {
public:
    /**
     * @brief Construct with the conflicting pattern
     * @param pattern Normalized pattern (e.g., "$.storage.files")
     */
    explicit PolicyConflictError(std::string pattern)
        : MergeError(ErrorKind::PolicyConflict,
                     "Conflicting policies for pattern '" + pattern +
                     "': declared both overwrite and append")
        , pattern_(std::move(pattern))
    {}

    const std::string& pattern() const noexcept {
        return pattern_;
    }

private:
    std::string pattern_;
};

/**
 * @brief Merge options file is malformed
 */
class OptionsError : public MergeError {
public:
    explicit OptionsError(const std::string& message)
        : MergeError(ErrorKind::Configuration, "Invalid merge options: " + message)
    {}
};

/**
 * @brief A document could not be loaded or parsed
 */
class LoadError : public MergeError {
public:
    /**
     * @brief Construct with source identifier and error details
     * @param source Document source identifier or file path
     * @param details Description of the failure
     */
    LoadError(std::string source, std::string details)
        : MergeError(ErrorKind::Load, details)
        , source_(std::move(source))
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept {
        return source_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    std::string details_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public LoadError {
public:
    explicit FileNotFoundError(const std::string& path)
        : LoadError(path, "Document file not found: " + path)
    {}
};

/**
 * @brief Document text could not be parsed (JSON/TOML/YAML syntax)
 */
class ParseError : public LoadError {
public:
    /**
     * @brief Construct with source, position and parser message
     * @param source Document source identifier
     * @param line 1-based line, 0 when unknown
     * @param column 1-based column, 0 when unknown
     * @param details Parser error message
     */
    ParseError(const std::string& source, int line, int column,
               const std::string& details)
        : LoadError(source, format_message(source, line, column, details))
        , line_(line)
        , column_(column)
    {}

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

private:
    int line_;
    int column_;

    static std::string format_message(const std::string& source, int line,
                                      int column, const std::string& details) {
        std::string msg = "Parse error in '" + source + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line) +
                   ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief Document extension does not name a supported format
 */
class UnsupportedFormatError : public LoadError {
public:
    UnsupportedFormatError(const std::string& source, const std::string& extension)
        : LoadError(source, "Unsupported document type '" + extension +
                            "' (expected .json, .toml, .yaml or .yml)")
    {}
};

/**
 * @brief A key holds different structural types in two documents
 */
class TypeMismatchError : public MergeError {
public:
    /**
     * @brief Construct with context path and both type names
     * @param path Context path of the key (e.g., "$.storage.files")
     * @param src_type Type name of the incoming value
     * @param dst_type Type name of the accumulated value
     */
    TypeMismatchError(std::string path, std::string src_type, std::string dst_type)
        : MergeError(ErrorKind::TypeMismatch,
                     "key[" + path + "] mismatch: src(" + src_type +
                     ") vs dst(" + dst_type + ")")
        , path_(std::move(path))
        , src_type_(std::move(src_type))
        , dst_type_(std::move(dst_type))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& src_type() const noexcept {
        return src_type_;
    }

    const std::string& dst_type() const noexcept {
        return dst_type_;
    }

private:
    std::string path_;
    std::string src_type_;
    std::string dst_type_;
};

/**
 * @brief A scalar key repeats with a different value under append policy
 */
class DuplicateKeyError : public MergeError {
public:
    explicit DuplicateKeyError(std::string path)
        : MergeError(ErrorKind::DuplicateKey,
                     "duplicate key[" + path + "] (overwrite=false)")
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief A merge failed while processing one document
 *
 * Wraps load, parse, mismatch and duplicate-key errors with the
 * identifier of the document being processed.
 */
class DocumentError : public MergeError {
public:
    /**
     * @brief Construct from the failing document and the underlying error
     * @param source Document source identifier
     * @param kind Category of the underlying error
     * @param path Context path of a merge conflict, empty for load errors
     * @param details Message of the underlying error
     */
    DocumentError(std::string source, ErrorKind kind, std::string path,
                  const std::string& details)
        : MergeError(kind, "document[" + source + "]: " + details)
        , source_(std::move(source))
        , path_(std::move(path))
    {}

    const std::string& source() const noexcept {
        return source_;
    }

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string source_;
    std::string path_;
};

} // namespace confmerge

#endif // CONFMERGE_ERRORS_HPP

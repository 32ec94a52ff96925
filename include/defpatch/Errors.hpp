/**
 * @file Errors.hpp
 * @brief Exception types for defpatch
 *
 * Error taxonomy:
 * - PatchError: Base class
 * - MalformedDocumentError: Markup broken or duplicate non-list siblings (fatal)
 * - EmptyTargetError: Path resolved to no targets (per operation)
 * - CollisionError: Duplicate non-list child would be created (per operation)
 * - PayloadError: Operation payload missing or malformed (per operation)
 * - FileNotFoundError: Input file not found
 * - ConfigError / MissingMandatoryConfig / KeyError / TypeError: run settings
 *
 * Per-operation errors are thrown by operation handlers and converted into
 * Failed outcomes by the Engine; they never escape a run.
 */

#ifndef DEFPATCH_ERRORS_HPP
#define DEFPATCH_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace defpatch {

/**
 * @brief Base class for all defpatch exceptions
 */
class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Structurally broken document
 *
 * Raised when markup is not well-formed or when siblings other than list
 * items share a tag name. Aborts the entire run.
 */
class MalformedDocumentError : public PatchError {
public:
    /**
     * @brief Construct with location and details
     * @param source Document name (file path or caller-supplied label)
     * @param line 1-based line, 0 if unknown
     * @param column 1-based column, 0 if unknown
     * @param details Description of the problem
     */
    MalformedDocumentError(std::string source, int line, int column, std::string details)
        : PatchError(format_message(source, line, column, details))
        , source_(std::move(source))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept { return source_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string source_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& source, int line, int column,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Malformed document '" << source << "'";
        if (line > 0) {
            oss << " (line " << line;
            if (column > 0) oss << ", column " << column;
            oss << ")";
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Path expression resolved to zero targets
 */
class EmptyTargetError : public PatchError {
public:
    explicit EmptyTargetError(std::string path)
        : PatchError("No nodes match path '" + path + "'")
        , path_(std::move(path))
    {}

    /**
     * @brief Get the path expression that matched nothing
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief A non-list child with the same tag already exists
 *
 * Raised by Add-child and Set-name when the mutation would leave two
 * non-`li` siblings sharing a tag under one parent.
 */
class CollisionError : public PatchError {
public:
    /**
     * @brief Construct with target path and colliding tag
     * @param path Path expression of the operation
     * @param tag Tag name that would be duplicated
     * @param identical True when the existing child equals the payload
     */
    CollisionError(std::string path, std::string tag, bool identical = false)
        : PatchError(std::string(identical ? "Duplicate of existing child" : "Child collides with existing") +
                     " <" + tag + "> at path '" + path + "'")
        , path_(std::move(path))
        , tag_(std::move(tag))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& tag() const noexcept { return tag_; }

private:
    std::string path_;
    std::string tag_;
};

/**
 * @brief Operation payload missing, malformed, or unsupported
 */
class PayloadError : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public PatchError {
public:
    explicit FileNotFoundError(std::string path)
        : PatchError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Base class for run-settings errors
 */
class ConfigError : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief Mandatory settings keys are missing after merge
 */
class MissingMandatoryConfig : public ConfigError {
public:
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : ConfigError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief Settings file could not be parsed (JSON/TOML syntax)
 */
class ConfigParseError : public ConfigError {
public:
    ConfigParseError(std::string file, std::string details)
        : ConfigError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Key not found during dot-path traversal of settings
 */
class KeyError : public ConfigError {
public:
    KeyError(std::string path, std::string segment)
        : ConfigError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& segment() const noexcept { return segment_; }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Traversal into a non-object settings value
 */
class TypeError : public ConfigError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : ConfigError("Cannot traverse into " + actual +
                      " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

} // namespace defpatch

#endif // DEFPATCH_ERRORS_HPP

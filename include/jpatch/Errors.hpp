/**
 * @file Errors.hpp
 * @brief Exception types for patch and diff errors
 *
 * Error taxonomy:
 * - PatchError: Base class
 * - InvalidOperation: Malformed op/path/from/value/index, move prefix conflict
 * - PointerSyntaxError: Malformed JSON Pointer text (an InvalidOperation)
 * - PathNotFound: Absent key or out-of-range existing index
 * - TypeMismatch: Traversal into non-container
 * - TestFailed: "test" operation mismatch
 * - DepthExceeded: Diff recursion bound reached
 * - DocumentParseError: JSON text could not be decoded
 * - FileNotFoundError: Input file missing or unreadable
 * - OptionsError: Diff options file or value is unusable
 */

#ifndef JPATCH_ERRORS_HPP
#define JPATCH_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace jpatch {

/**
 * @brief Base class for all jpatch exceptions
 */
class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Operation is malformed or cannot be carried out as written
 *
 * Raised for missing members, unknown op names, bad array index segments,
 * removal of the document root and move into a descendant of its source.
 */
class InvalidOperation : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief JSON Pointer text is malformed
 *
 * Derives from InvalidOperation: a bad "path" or "from" makes the whole
 * operation invalid.
 */
class PointerSyntaxError : public InvalidOperation {
public:
    /**
     * @brief Construct with offending pointer and reason
     * @param pointer Pointer text as given
     * @param reason Short description of the problem
     */
    PointerSyntaxError(std::string pointer, const std::string& reason)
        : InvalidOperation("Invalid JSON Pointer '" + pointer + "': " + reason)
        , pointer_(std::move(pointer))
    {}

    /**
     * @brief Get the pointer text that failed to parse
     */
    const std::string& pointer() const noexcept {
        return pointer_;
    }

private:
    std::string pointer_;
};

/**
 * @brief Path does not resolve in the document
 */
class PathNotFound : public PatchError {
public:
    /**
     * @brief Construct with full path and message prefix
     * @param path Full pointer being resolved (encoded form)
     * @param context Operation context, e.g. "Operation 2 (remove)"
     */
    explicit PathNotFound(std::string path, const std::string& context = "")
        : PatchError((context.empty() ? "" : context + ": ") +
                     "Path does not exist: '" + path + "'")
        , path_(std::move(path))
    {}

    /**
     * @brief Get the pointer that could not be resolved
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Type mismatch during pointer traversal
 *
 * Raised when attempting to traverse into or modify a child of a scalar.
 */
class TypeMismatch : public PatchError {
public:
    /**
     * @brief Construct with path and actual type
     * @param path Pointer of the non-container value (encoded form)
     * @param actual Actual type encountered (e.g., "integer")
     * @param context Operation context, e.g. "Operation 0 (add)"
     */
    TypeMismatch(std::string path, std::string actual, const std::string& context = "")
        : PatchError((context.empty() ? "" : context + ": ") +
                     "Cannot traverse into " + actual +
                     " (expected list or map) at path '" + path + "'")
        , path_(std::move(path))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string actual_;
};

/**
 * @brief A "test" operation found a different value
 */
class TestFailed : public PatchError {
public:
    explicit TestFailed(std::string path)
        : PatchError("Test failed at path: '" + path + "'")
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Diff recursion went deeper than the configured bound
 */
class DepthExceeded : public PatchError {
public:
    explicit DepthExceeded(std::size_t limit)
        : PatchError("Maximum nesting depth exceeded during diff (limit " +
                     std::to_string(limit) + ")")
        , limit_(limit)
    {}

    std::size_t limit() const noexcept {
        return limit_;
    }

private:
    std::size_t limit_;
};

/**
 * @brief JSON text could not be decoded
 */
class DocumentParseError : public PatchError {
public:
    /**
     * @brief Construct with what was being parsed and parser details
     * @param what Which input failed ("document", "patch", a file path)
     * @param details Detailed error message from parser
     */
    DocumentParseError(std::string what, std::string details)
        : PatchError("Invalid " + what + " JSON: " + details)
        , what_(std::move(what))
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept {
        return what_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string what_;
    std::string details_;
};

/**
 * @brief Input file not found or not readable
 */
class FileNotFoundError : public PatchError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : PatchError("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Diff options could not be loaded or have the wrong shape
 */
class OptionsError : public PatchError {
public:
    using PatchError::PatchError;
};

} // namespace jpatch

#endif // JPATCH_ERRORS_HPP

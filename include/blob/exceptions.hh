/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the blob library
 * @author Igor
 * @date 19/10/2026
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the blob library. End of stream is never
 * reported through exceptions.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <blob/export_blob.h>

namespace blob {

    /**
     * @class blob_error
     * @brief Base exception class for all blob-related errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all blob-specific errors with a single catch block.
     */
    class BLOB_EXPORT blob_error : public std::runtime_error {
    public:
        explicit blob_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class invalid_configuration
     * @brief Thrown when stream options are malformed
     *
     * Raised while constructing a stream; the stream is not created.
     */
    class BLOB_EXPORT invalid_configuration : public blob_error {
    public:
        explicit invalid_configuration(const std::string& msg)
            : blob_error(msg) {}
    };

    /**
     * @class invalid_source
     * @brief Thrown when a stream is constructed without a usable source
     */
    class BLOB_EXPORT invalid_source : public blob_error {
    public:
        explicit invalid_source(const std::string& msg)
            : blob_error(msg) {}
    };

    /**
     * @class invalid_offset
     * @brief Thrown when a seek target lies outside the valid range
     *
     * The stream position is left untouched, the caller may retry.
     */
    class BLOB_EXPORT invalid_offset : public blob_error {
    public:
        explicit invalid_offset(const std::string& msg)
            : blob_error(msg) {}
    };

    /**
     * @class chunk_out_of_range
     * @brief Thrown when a chunk index exceeds the chunk count
     *
     * Seek arithmetic never produces such an index, so this signals
     * a boundary computation defect rather than a user error.
     */
    class BLOB_EXPORT chunk_out_of_range : public blob_error {
    public:
        explicit chunk_out_of_range(const std::string& msg)
            : blob_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when the underlying source fails to deliver a slice or
     * when a closed stream is used. The chunk cache keeps its last
     * good contents.
     */
    class BLOB_EXPORT io_error : public blob_error {
    public:
        explicit io_error(const std::string& msg)
            : blob_error(msg) {}
    };

    /**
     * @class invalid_argument
     * @brief Thrown for malformed buffer/offset/length combinations
     */
    class BLOB_EXPORT invalid_argument : public blob_error {
    public:
        explicit invalid_argument(const std::string& msg)
            : blob_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def BLOB_THROW
     * @brief Throw an exception of the given blob error class
     * @param kind Unqualified exception class name (e.g. invalid_offset)
     * @param ... Variable arguments to format into error message
     */
    #define BLOB_THROW(kind, ...) \
        throw ::blob::kind(::blob::build_error_msg(__VA_ARGS__))

    /**
     * @def BLOB_THROW_IF
     * @brief Conditionally throw a blob error
     * @param condition Condition to check
     * @param kind Unqualified exception class name
     * @param ... Variable arguments for error message if condition is true
     */
    #define BLOB_THROW_IF(condition, kind, ...) \
        do { if (condition) BLOB_THROW(kind, __VA_ARGS__); } while(0)

    /**
     * @def BLOB_THROW_UNLESS
     * @brief Throw a blob error unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param kind Unqualified exception class name
     * @param ... Variable arguments for error message if condition is false
     */
    #define BLOB_THROW_UNLESS(condition, kind, ...) \
        do { if (!(condition)) BLOB_THROW(kind, __VA_ARGS__); } while(0)

    /**
     * @def BLOB_THROW_IO
     * @brief Throw an io_error with formatted message
     * @param ... Variable arguments to format into error message
     */
    #define BLOB_THROW_IO(...) \
        BLOB_THROW(io_error, __VA_ARGS__)

    /**
     * @def BLOB_THROW_IO_IF
     * @brief Conditionally throw an io_error
     * @param condition Condition to check
     * @param ... Variable arguments for error message if condition is true
     */
    #define BLOB_THROW_IO_IF(condition, ...) \
        do { if (condition) BLOB_THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace blob

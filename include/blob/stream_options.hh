/**
 * @file stream_options.hh
 * @brief Stream configuration for chunked blob readers
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <blob/export_blob.h>

namespace blob {

    inline constexpr std::size_t byte = 1;
    inline constexpr std::size_t kilobyte = byte * 1024;
    inline constexpr std::size_t megabyte = kilobyte * 1024;
    inline constexpr std::size_t gigabyte = megabyte * 1024;

    /**
     * @enum open_mode
     * @brief Capability flags of a stream
     *
     * Flags combine with `|`. Only reading is implemented; a stream
     * requesting write access is rejected by validate().
     */
    enum class open_mode : unsigned {
        none  = 0,
        read  = 1u << 0,
        write = 1u << 1
    };

    constexpr open_mode operator | (open_mode a, open_mode b) {
        return static_cast<open_mode>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
    }

    constexpr open_mode operator & (open_mode a, open_mode b) {
        return static_cast<open_mode>(static_cast<unsigned>(a) & static_cast<unsigned>(b));
    }

    constexpr bool has_flag(open_mode set, open_mode flag) {
        return (set & flag) == flag && flag != open_mode::none;
    }

    /**
     * @enum stream_type
     * @brief Selects the reader variant created by open_stream()
     */
    enum class stream_type {
        binary, ///< Byte and buffer reads only
        text    ///< Adds line oriented reads
    };

    /**
     * @struct stream_options
     * @brief Configuration options for a chunked stream
     *
     * Fixed once the stream is constructed.
     */
    struct stream_options {
        /**
         * @brief Number of bytes materialized per chunk
         *
         * Must be at least 1. Default is 1KB.
         */
        std::size_t chunk_size = kilobyte;

        /**
         * @brief Capability flags, must contain open_mode::read
         */
        open_mode mode = open_mode::read;

        /**
         * @brief Binary or text stream
         */
        stream_type type = stream_type::binary;

        /**
         * @brief Consumers are expected to drain the stream to EOF
         *
         * When set, closing a stream before EOF reports an
         * "unread_data" warning.
         */
        bool read_all = false;

        /**
         * @brief Display name used when the source has none
         *
         * Left at its default, a named source (e.g. a file) supplies
         * the name instead.
         */
        std::string default_file_name = "file";

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Absolute stream offset where the warning occurred
         * @param category Warning category (e.g., "truncated_read", "unread_data")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during reading.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

    /**
     * @brief Check options for consistency
     * @param options Options to check
     * @throws invalid_configuration if the chunk size is zero, the mode
     *         lacks read access or requests write access
     */
    BLOB_EXPORT void validate(const stream_options& options);

    /**
     * @brief Parse a mode string such as "r" or "rw"
     * @param text Mode letters, 'r' for read and 'w' for write
     * @return Combined flag set
     * @throws invalid_configuration on unknown letters or empty input
     */
    BLOB_EXPORT open_mode parse_open_mode(std::string_view text);

    /**
     * @brief Parse "binary" or "text"
     * @throws invalid_configuration on any other value
     */
    BLOB_EXPORT stream_type parse_stream_type(std::string_view text);

    BLOB_EXPORT std::string_view to_string(stream_type type);

} // namespace blob

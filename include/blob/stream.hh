/**
 * @file stream.hh
 * @brief Chunked random-access streams over large blobs
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <blob/source.hh>
#include <blob/chunk_table.hh>
#include <blob/chunk_cache.hh>
#include <blob/stream_options.hh>
#include <blob/export_blob.h>

namespace blob {

    class text_stream;

    /**
     * @class stream
     * @brief Binary reader keeping one chunk of a source in memory
     *
     * Reads cross chunk boundaries transparently: when the cursor reaches
     * the end of the resident chunk, the next read loads the following one.
     * Seeking loads the target chunk only if it differs from the resident
     * one. End of stream is not an error: read_byte() returns an empty
     * optional and buffer reads return short counts.
     *
     * A stream exclusively owns its source and is not safe for concurrent
     * use.
     */
    class BLOB_EXPORT stream {
    public:
        /**
         * @brief Open a stream over @p src and load its first chunk
         * @param src Source to read, ownership is taken
         * @param options Stream options
         * @throws invalid_configuration if the options fail validate()
         * @throws invalid_source if src is null
         * @throws io_error if the first chunk cannot be read
         */
        explicit stream(std::unique_ptr<source> src, const stream_options& options = {});

        virtual ~stream();

        stream(const stream&) = delete;
        stream& operator = (const stream&) = delete;

        /**
         * @brief Current absolute position
         */
        [[nodiscard]] std::uint64_t tell() const;

        /**
         * @brief Move to an absolute position
         * @param offset Target position, 0 <= offset <= size()
         * @throws invalid_offset if offset is past the end; position unchanged
         * @throws io_error if the target chunk cannot be read; position unchanged
         */
        void seek(std::uint64_t offset);

        /**
         * @brief Move inside the resident chunk without loading anything
         * @param offset Chunk-local position, 0 <= offset <= chunk size
         * @return New absolute position
         * @throws invalid_offset if offset exceeds the chunk size
         */
        std::uint64_t seek_local(std::size_t offset);

        /**
         * @brief Advance up to @p count bytes
         * @return Number of bytes actually skipped, less than count only at EOF
         */
        std::uint64_t skip(std::uint64_t count);

        /**
         * @brief True once the absolute position reached size()
         */
        [[nodiscard]] bool eof() const;

        [[nodiscard]] std::uint64_t size() const { return m_table.length(); }
        [[nodiscard]] std::uint64_t remaining() const;

        [[nodiscard]] std::uint64_t chunk_count() const { return m_table.count(); }
        [[nodiscard]] std::uint64_t chunk_index() const { return m_cursor.chunk; }
        [[nodiscard]] std::size_t local_position() const { return m_cursor.position; }
        [[nodiscard]] const chunk_table& chunks() const { return m_table; }

        /**
         * @brief Read a single byte
         * @return The byte, or std::nullopt at EOF
         */
        std::optional<std::byte> read_byte();

        /**
         * @brief Read up to @p size bytes into @p dst
         *
         * Copies chunk by chunk. If loading a later chunk fails, the bytes
         * copied before the failure stay in @p dst and the cursor stays
         * behind them, exactly as after the same sequence of read_byte()
         * calls. tell() then reports how far the read got.
         *
         * @return Number of bytes read, less than size only at EOF
         * @throws invalid_argument if dst is null and size is not zero
         * @throws io_error if the stream is closed, even when size is zero
         */
        std::size_t read(void* dst, std::size_t size);

        /**
         * @brief Fill the whole buffer, or as much of it as the stream has left
         * @return Number of bytes written to the front of buffer
         */
        std::size_t read_into(std::vector<std::byte>& buffer);

        /**
         * @brief Fill buffer[offset, offset + len)
         *
         * Bytes outside the range are never touched.
         *
         * @return Number of bytes written, less than len only at EOF
         * @throws invalid_argument if the range does not fit in the buffer
         */
        std::size_t read_into_range(std::vector<std::byte>& buffer, std::size_t offset, std::size_t len);

        /**
         * @brief Read up to @p n bytes
         */
        std::vector<std::byte> read_bytes(std::size_t n);

        /**
         * @brief Read everything up to EOF
         */
        std::vector<std::byte> read_all();

        [[nodiscard]] const stream_options& options() const { return m_options; }
        [[nodiscard]] stream_type type() const { return m_options.type; }
        [[nodiscard]] const std::string& file_name() const { return m_file_name; }
        [[nodiscard]] bool readable() const { return has_flag(m_options.mode, open_mode::read); }
        [[nodiscard]] bool writable() const { return has_flag(m_options.mode, open_mode::write); }
        [[nodiscard]] bool is_open() const { return m_open; }

        /**
         * @brief Release the source and the resident chunk
         *
         * Idempotent. Reads and seeks afterwards throw io_error. Reports
         * "unread_data" when options().read_all is set and EOF was not
         * reached.
         */
        void close();

        /**
         * @brief Line reading interface, nullptr for binary streams
         */
        virtual text_stream* as_text() { return nullptr; }

    protected:
        void warn(std::string_view category, std::string_view message) const;
        void ensure_open() const;

    private:
        std::uint64_t transfer(std::byte* dst, std::uint64_t size);
        void advance_chunk();

        stream_options m_options;
        std::unique_ptr<source> m_source;
        chunk_table m_table;
        chunk_cache m_cache;
        cursor m_cursor;
        std::string m_file_name;
        bool m_open;
    };

    /**
     * @struct line_result
     * @brief Text produced by a line read
     */
    struct line_result {
        std::string text;       ///< Line content, terminators stripped
        bool truncated = false; ///< EOF came before the expected terminator or line count
    };

    /**
     * @class text_stream
     * @brief Stream with line oriented reads
     *
     * Lines end with a single LF (0x0A). Bytes are mapped one to one onto
     * chars; no character decoding is done.
     */
    class BLOB_EXPORT text_stream : public stream {
    public:
        explicit text_stream(std::unique_ptr<source> src, const stream_options& options = {});

        /**
         * @brief Read up to and excluding the next LF
         *
         * Every call counts as a line in current_line(), including one that
         * finds the stream already at EOF.
         *
         * @return The line; truncated is set when EOF ended it instead of LF
         */
        line_result read_line();

        /**
         * @brief Read up to @p count lines joined by '\n'
         *
         * Stops at the first line ended by EOF. A non-empty unterminated
         * last line still counts. When fewer than count lines were
         * produced the result is truncated and a "truncated_read" warning
         * is reported.
         */
        line_result read_lines(std::size_t count);

        /**
         * @brief Number of read_line() calls so far
         */
        [[nodiscard]] std::uint64_t current_line() const { return m_current_line; }

        text_stream* as_text() override { return this; }

    private:
        std::uint64_t m_current_line;
    };

    /**
     * @brief Factory choosing the stream variant from options.type
     * @param src Source to read, ownership is taken
     * @param options Stream options
     * @return text_stream for stream_type::text, stream otherwise
     */
    BLOB_EXPORT std::unique_ptr<stream> open_stream(std::unique_ptr<source> src, const stream_options& options);

    BLOB_EXPORT std::unique_ptr<stream> open_stream(std::unique_ptr<source> src);

    /**
     * @brief Open a file as a stream
     * @throws invalid_source if the file cannot be opened
     */
    BLOB_EXPORT std::unique_ptr<stream> open_file(const std::filesystem::path& path, const stream_options& options);

} // namespace blob

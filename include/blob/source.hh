/**
 * @file source.hh
 * @brief Byte sources that chunked streams read from
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <blob/export_blob.h>

namespace blob {

    /**
     * @class source
     * @brief Immutable byte range of known length
     *
     * A source is owned by exactly one stream. Streams never modify it;
     * they only request slices of it.
     */
    class BLOB_EXPORT source {
    public:
        virtual ~source() = default;

        /**
         * @brief Total number of bytes in the source
         *
         * Constant for the lifetime of the object.
         */
        virtual std::uint64_t size() const = 0;

        /**
         * @brief Copy the bytes of the half-open range [start, end)
         * @param start First byte offset, must not exceed end
         * @param end One past the last byte offset, clamped to size()
         * @return min(end, size()) - start bytes
         * @throws io_error if the underlying storage fails
         */
        virtual std::vector<std::byte> slice(std::uint64_t start, std::uint64_t end) = 0;

        /**
         * @brief Display name of the source, if it has one
         */
        virtual std::optional<std::string> name() const { return std::nullopt; }
    };

    /**
     * @class memory_source
     * @brief Source backed by an in-memory byte vector
     */
    class BLOB_EXPORT memory_source : public source {
    public:
        explicit memory_source(std::vector<std::byte> data);
        explicit memory_source(const std::string& text);

        std::uint64_t size() const override;
        std::vector<std::byte> slice(std::uint64_t start, std::uint64_t end) override;

    private:
        std::vector<std::byte> m_data;
    };

    /**
     * @class istream_source
     * @brief Source backed by a seekable std::istream
     *
     * The size is measured once at construction. Each slice seeks to its
     * start before reading, so the stream position is not preserved.
     */
    class BLOB_EXPORT istream_source : public source {
    public:
        /**
         * @brief Borrow a stream; it must outlive this source
         */
        explicit istream_source(std::istream& is);

        /**
         * @brief Take ownership of a stream
         * @throws invalid_source if the pointer is null
         */
        explicit istream_source(std::unique_ptr<std::istream> is);

        ~istream_source() override;

        istream_source(const istream_source&) = delete;
        istream_source& operator = (const istream_source&) = delete;

        std::uint64_t size() const override { return m_size; }
        std::vector<std::byte> slice(std::uint64_t start, std::uint64_t end) override;

    private:
        std::uint64_t measure();

        std::unique_ptr<std::istream> m_owned;
        std::istream* m_stream;  // Either m_owned or a borrowed stream
        std::uint64_t m_size;
    };

    /**
     * @class file_source
     * @brief Source reading a file from disk
     *
     * Reports the file name (without directories) as its name.
     */
    class BLOB_EXPORT file_source : public istream_source {
    public:
        /**
         * @throws invalid_source if the file cannot be opened
         */
        explicit file_source(const std::filesystem::path& path);

        std::optional<std::string> name() const override;

        const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };

} // namespace blob

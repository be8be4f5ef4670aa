/**
 * @file chunk_table.hh
 * @brief Partition of a source into fixed-size chunks
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <blob/export_blob.h>

namespace blob {

    /**
     * @struct chunk_range
     * @brief Half-open byte range [begin, end) of one chunk
     */
    struct chunk_range {
        std::uint64_t begin = 0;
        std::uint64_t end = 0;

        [[nodiscard]] std::uint64_t size() const { return end - begin; }

        bool operator == (const chunk_range& other) const {
            return begin == other.begin && end == other.end;
        }

        bool operator != (const chunk_range& other) const {
            return !(*this == other);
        }
    };

    /**
     * @class chunk_table
     * @brief Derives chunk count and chunk ranges from a length
     *
     * Chunk i covers [i * chunk_size, min((i + 1) * chunk_size, length)).
     * The ranges partition [0, length) without gaps or overlaps; only the
     * last chunk may be shorter than chunk_size.
     */
    class BLOB_EXPORT chunk_table {
    public:
        /**
         * @param length Total number of bytes
         * @param chunk_size Bytes per chunk
         * @throws invalid_configuration if chunk_size is zero
         */
        chunk_table(std::uint64_t length, std::size_t chunk_size);

        /**
         * @brief Number of chunks, ceil(length / chunk_size)
         */
        [[nodiscard]] std::uint64_t count() const { return m_count; }

        [[nodiscard]] std::uint64_t length() const { return m_length; }
        [[nodiscard]] std::size_t chunk_size() const { return m_chunk_size; }

        /**
         * @brief Byte range of chunk @p index
         * @throws chunk_out_of_range if index >= count()
         */
        [[nodiscard]] chunk_range range(std::uint64_t index) const;

        /**
         * @brief Index of the chunk holding @p offset, floor(offset / chunk_size)
         *
         * No range check: offset == length maps to count() when length
         * is a multiple of chunk_size.
         */
        [[nodiscard]] std::uint64_t chunk_of(std::uint64_t offset) const {
            return offset / m_chunk_size;
        }

    private:
        std::uint64_t m_length;
        std::size_t m_chunk_size;
        std::uint64_t m_count;
    };

} // namespace blob

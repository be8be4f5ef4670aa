/**
 * @file chunk_cache.hh
 * @brief Single-slot chunk cache and read cursor
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <blob/chunk_table.hh>
#include <blob/export_blob.h>

namespace blob {
    class source;

    // Single resident chunk of a source. A load either replaces the slot
    // completely or leaves it as it was.
    class BLOB_EXPORT chunk_cache {
        public:
            chunk_cache(source* src, const chunk_table* table);

            chunk_cache(const chunk_cache&) = delete;
            chunk_cache& operator = (const chunk_cache&) = delete;

            // Throws chunk_out_of_range or io_error, the slot is untouched then
            void load(std::uint64_t index);

            // Drops the cached bytes and detaches from the source
            void release();

            [[nodiscard]] std::uint64_t index() const { return m_index; }
            [[nodiscard]] bool resident() const { return m_resident; }
            [[nodiscard]] std::size_t size() const { return m_bytes.size(); }
            [[nodiscard]] const std::byte* data() const { return m_bytes.data(); }

            std::byte operator [] (std::size_t pos) const { return m_bytes[pos]; }

        private:
            source* m_source;            // Non-owning, the stream owns the source
            const chunk_table* m_table;
            std::uint64_t m_index;
            bool m_resident;
            std::vector<std::byte> m_bytes;
    };

    // Read position, chunk index plus offset inside that chunk.
    // position == chunk_size means "advance on next read".
    struct cursor {
        std::uint64_t chunk = 0;
        std::size_t position = 0;

        [[nodiscard]] std::uint64_t absolute(std::size_t chunk_size) const {
            return chunk * chunk_size + position;
        }
    };
}

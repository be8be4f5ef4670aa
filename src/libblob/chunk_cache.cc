//
// Created by igor on 19/10/2026.
//

#include <blob/chunk_cache.hh>
#include <blob/source.hh>
#include <blob/exceptions.hh>

namespace blob {

    chunk_cache::chunk_cache(source* src, const chunk_table* table)
        : m_source(src), m_table(table), m_index(0), m_resident(false) {
        if (!m_source || !m_table) {
            BLOB_THROW(invalid_source, "Invalid source provided to chunk_cache");
        }
    }

    void chunk_cache::load(std::uint64_t index) {
        BLOB_THROW_IO_IF(!m_source, "Chunk cache is detached from its source");

        chunk_range range = m_table->range(index);

        std::vector<std::byte> bytes;
        try {
            bytes = m_source->slice(range.begin, range.end);
        } catch (const io_error&) {
            throw;
        } catch (const std::exception& e) {
            BLOB_THROW_IO("Error reading chunk ", index, ": ", e.what());
        }

        BLOB_THROW_IO_IF(bytes.size() != range.size(),
                    "Error reading chunk ", index, ": expected ", range.size(),
                    " bytes at offset ", range.begin, ", got ", bytes.size());

        m_bytes.swap(bytes);
        m_index = index;
        m_resident = true;
    }

    void chunk_cache::release() {
        std::vector<std::byte>().swap(m_bytes);
        m_source = nullptr;
        m_resident = false;
    }
}

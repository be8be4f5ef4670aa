//
// Created by igor on 19/10/2026.
//

#include <blob/chunk_table.hh>
#include <blob/exceptions.hh>
#include <algorithm>

namespace blob {

    chunk_table::chunk_table(std::uint64_t length, std::size_t chunk_size)
        : m_length(length), m_chunk_size(chunk_size), m_count(0) {
        BLOB_THROW_IF(chunk_size == 0, invalid_configuration, "Chunk size must be at least 1 byte");
        m_count = length / chunk_size + (length % chunk_size != 0 ? 1 : 0);
    }

    chunk_range chunk_table::range(std::uint64_t index) const {
        BLOB_THROW_IF(index >= m_count, chunk_out_of_range,
                      "Attempted to access chunk ", index, " beyond the bounds of the blob (",
                      m_count, " chunks of ", m_chunk_size, " bytes)");

        chunk_range r;
        r.begin = index * m_chunk_size;
        r.end = std::min<std::uint64_t>(r.begin + m_chunk_size, m_length);
        return r;
    }

} // namespace blob

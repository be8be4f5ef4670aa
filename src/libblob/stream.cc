//
// Created by igor on 19/10/2026.
//

#include <blob/stream.hh>
#include <blob/exceptions.hh>
#include <algorithm>
#include <cstring>

namespace blob {
    namespace {
        const stream_options& checked(const stream_options& options) {
            validate(options);
            return options;
        }

        std::unique_ptr<source> checked(std::unique_ptr<source> src) {
            BLOB_THROW_UNLESS(src, invalid_source, "Invalid source given to stream");
            return src;
        }

        std::string display_name(const source& src, const stream_options& options) {
            static const std::string default_name = stream_options{}.default_file_name;

            auto name = src.name();
            if (name && options.default_file_name == default_name) {
                return *name;
            }
            return options.default_file_name;
        }
    }

    stream::stream(std::unique_ptr<source> src, const stream_options& options)
        : m_options(checked(options))
        , m_source(checked(std::move(src)))
        , m_table(m_source->size(), m_options.chunk_size)
        , m_cache(m_source.get(), &m_table)
        , m_file_name(display_name(*m_source, m_options))
        , m_open(true) {
        if (m_table.count() > 0) {
            m_cache.load(0);
        }
    }

    stream::~stream() = default;

    std::uint64_t stream::tell() const {
        return m_cursor.absolute(m_table.chunk_size());
    }

    bool stream::eof() const {
        return tell() >= m_table.length();
    }

    std::uint64_t stream::remaining() const {
        std::uint64_t pos = tell();
        return pos >= m_table.length() ? 0 : m_table.length() - pos;
    }

    void stream::seek(std::uint64_t offset) {
        ensure_open();
        BLOB_THROW_IF(offset > m_table.length(), invalid_offset,
                      "Attempted to seek to offset ", offset,
                      " - blob size is only ", m_table.length(), " bytes");

        const std::size_t chunk_size = m_table.chunk_size();
        cursor target;
        if (offset == m_table.length() && offset > 0 && offset % chunk_size == 0) {
            // Rest on the end of the last chunk instead of a chunk that does not exist
            target.chunk = m_table.count() - 1;
            target.position = chunk_size;
        } else {
            target.chunk = m_table.chunk_of(offset);
            target.position = static_cast<std::size_t>(offset % chunk_size);
        }

        if (target.chunk != m_cache.index()) {
            m_cache.load(target.chunk);
        }
        m_cursor = target;
    }

    std::uint64_t stream::seek_local(std::size_t offset) {
        ensure_open();
        BLOB_THROW_IF(offset > m_table.chunk_size(), invalid_offset,
                      "Attempted to seek to local offset ", offset,
                      " - chunk size is only ", m_table.chunk_size(), " bytes");
        m_cursor.position = offset;
        return tell();
    }

    std::uint64_t stream::skip(std::uint64_t count) {
        ensure_open();
        return transfer(nullptr, count);
    }

    void stream::advance_chunk() {
        m_cache.load(m_cache.index() + 1);
        m_cursor.chunk = m_cache.index();
        m_cursor.position = 0;
    }

    std::optional<std::byte> stream::read_byte() {
        ensure_open();
        if (eof()) {
            return std::nullopt;
        }
        if (m_cursor.position == m_table.chunk_size()) {
            advance_chunk();
        }
        return m_cache[m_cursor.position++];
    }

    std::uint64_t stream::transfer(std::byte* dst, std::uint64_t size) {
        std::uint64_t done = 0;
        while (done < size && !eof()) {
            if (m_cursor.position == m_table.chunk_size()) {
                advance_chunk();
            }

            std::size_t available = m_cache.size() - m_cursor.position;
            std::size_t to_copy = static_cast<std::size_t>(std::min<std::uint64_t>(available, size - done));
            if (dst) {
                std::memcpy(dst + done, m_cache.data() + m_cursor.position, to_copy);
            }
            m_cursor.position += to_copy;
            done += to_copy;
        }
        return done;
    }

    std::size_t stream::read(void* dst, std::size_t size) {
        ensure_open();
        if (size == 0) {
            return 0;
        }
        BLOB_THROW_UNLESS(dst, invalid_argument, "Null buffer in read");
        return static_cast<std::size_t>(transfer(static_cast<std::byte*>(dst), size));
    }

    std::size_t stream::read_into(std::vector<std::byte>& buffer) {
        return read(buffer.data(), buffer.size());
    }

    std::size_t stream::read_into_range(std::vector<std::byte>& buffer, std::size_t offset, std::size_t len) {
        ensure_open();
        BLOB_THROW_IF(offset > buffer.size() || len > buffer.size() - offset, invalid_argument,
                      "Range [", offset, ", ", offset, " + ", len, ") does not fit into a buffer of ",
                      buffer.size(), " bytes");
        if (len == 0) {
            return 0;
        }
        return read(buffer.data() + offset, len);
    }

    std::vector<std::byte> stream::read_bytes(std::size_t n) {
        ensure_open();
        std::vector<std::byte> result(static_cast<std::size_t>(std::min<std::uint64_t>(n, remaining())));
        if (!result.empty()) {
            std::size_t actual = read(result.data(), result.size());
            result.resize(actual);
        }
        return result;
    }

    std::vector<std::byte> stream::read_all() {
        return read_bytes(static_cast<std::size_t>(remaining()));
    }

    void stream::close() {
        if (!m_open) {
            return;
        }
        if (m_options.read_all && !eof()) {
            warn("unread_data", build_error_msg("Stream closed with ", remaining(),
                                                " unread bytes in ", m_file_name));
        }
        m_cache.release();
        m_source.reset();
        m_open = false;
    }

    void stream::warn(std::string_view category, std::string_view message) const {
        if (m_options.on_warning) {
            m_options.on_warning(tell(), category, message);
        }
    }

    void stream::ensure_open() const {
        BLOB_THROW_IO_IF(!m_open, "Stream ", m_file_name, " is closed");
    }

    std::unique_ptr<stream> open_stream(std::unique_ptr<source> src, const stream_options& options) {
        switch (options.type) {
            case stream_type::text:
                return std::make_unique<text_stream>(std::move(src), options);
            case stream_type::binary:
                break;
        }
        return std::make_unique<stream>(std::move(src), options);
    }

    std::unique_ptr<stream> open_stream(std::unique_ptr<source> src) {
        return open_stream(std::move(src), stream_options{});
    }

    std::unique_ptr<stream> open_file(const std::filesystem::path& path, const stream_options& options) {
        return open_stream(std::make_unique<file_source>(path), options);
    }

} // namespace blob

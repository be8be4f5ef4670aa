//
// Created by igor on 19/10/2026.
//

#include <istream>
#include <fstream>
#include <algorithm>
#include <cstring>

#include <blob/source.hh>
#include <blob/exceptions.hh>

namespace blob {
    namespace {
        std::unique_ptr<std::istream> open_file(const std::filesystem::path& path) {
            auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
            BLOB_THROW_UNLESS(file->is_open(), invalid_source,
                              "Cannot open file ", path.string());
            return file;
        }
    }

    // memory_source implementation
    memory_source::memory_source(std::vector<std::byte> data)
        : m_data(std::move(data)) {}

    memory_source::memory_source(const std::string& text)
        : m_data(text.size()) {
        if (!text.empty()) {
            std::memcpy(m_data.data(), text.data(), text.size());
        }
    }

    std::uint64_t memory_source::size() const {
        return m_data.size();
    }

    std::vector<std::byte> memory_source::slice(std::uint64_t start, std::uint64_t end) {
        end = std::min<std::uint64_t>(end, m_data.size());
        if (start >= end) {
            return {};
        }
        return std::vector<std::byte>(m_data.begin() + static_cast<std::ptrdiff_t>(start),
                                      m_data.begin() + static_cast<std::ptrdiff_t>(end));
    }

    // istream_source implementation
    istream_source::istream_source(std::istream& is)
        : m_stream(&is), m_size(measure()) {}

    istream_source::istream_source(std::unique_ptr<std::istream> is)
        : m_owned(std::move(is)), m_stream(m_owned.get()), m_size(0) {
        BLOB_THROW_UNLESS(m_stream, invalid_source, "Null stream given to istream_source");
        m_size = measure();
    }

    istream_source::~istream_source() = default;

    std::uint64_t istream_source::measure() {
        m_stream->clear();
        auto start = m_stream->tellg();
        BLOB_THROW_IF(start == std::streampos(-1), invalid_source, "Source stream is not seekable");

        m_stream->seekg(0, std::ios_base::end);
        auto end = m_stream->tellg();
        BLOB_THROW_IF(end == std::streampos(-1), invalid_source, "Failed to get source stream size");

        m_stream->seekg(0, std::ios_base::beg);
        return static_cast<std::uint64_t>(end);
    }

    std::vector<std::byte> istream_source::slice(std::uint64_t start, std::uint64_t end) {
        end = std::min(end, m_size);
        if (start >= end) {
            return {};
        }

        m_stream->clear();
        m_stream->seekg(static_cast<std::streamoff>(start), std::ios_base::beg);
        BLOB_THROW_IO_IF(m_stream->fail(), "Cannot seek source to offset ", start,
                    " - source size is ", m_size, " bytes");

        std::vector<std::byte> buffer(static_cast<std::size_t>(end - start));
        m_stream->read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = static_cast<std::size_t>(m_stream->gcount());

        BLOB_THROW_IO_IF(m_stream->bad(), "Source read failed at offset ", start);
        buffer.resize(bytes_read);
        return buffer;
    }

    // file_source implementation
    file_source::file_source(const std::filesystem::path& path)
        : istream_source(open_file(path)), m_path(path) {}

    std::optional<std::string> file_source::name() const {
        return m_path.filename().string();
    }
}

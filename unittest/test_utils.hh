#pragma once

#include <memory>
#include <filesystem>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <blob/source.hh>
#include <blob/exceptions.hh>
#include "unittest_config.h"

// Path of a file in the unittest data directory
inline std::filesystem::path test_data_path(const std::string& name) {
    static std::filesystem::path root(UNITTEST_PATH_TO_DATA);
    return root / name;
}

// Deterministic byte pattern, position i holds a value derived from i
inline std::vector<std::byte> make_pattern(std::size_t length) {
    std::vector<std::byte> data(length);
    for (std::size_t i = 0; i < length; ++i) {
        data[i] = static_cast<std::byte>((i * 31 + i / 251) & 0xFF);
    }
    return data;
}

inline std::unique_ptr<blob::source> pattern_source(std::size_t length) {
    return std::make_unique<blob::memory_source>(make_pattern(length));
}

// Source wrapper counting slice requests
class counting_source : public blob::source {
public:
    explicit counting_source(std::vector<std::byte> data)
        : m_inner(std::move(data)) {}

    std::uint64_t size() const override { return m_inner.size(); }

    std::vector<std::byte> slice(std::uint64_t start, std::uint64_t end) override {
        ++m_slices;
        m_last_start = start;
        return m_inner.slice(start, end);
    }

    int slices() const { return m_slices; }
    std::uint64_t last_start() const { return m_last_start; }

private:
    blob::memory_source m_inner;
    int m_slices = 0;
    std::uint64_t m_last_start = 0;
};

// Source that starts failing after a number of successful slices
class failing_source : public blob::source {
public:
    enum failure_kind {
        throws_io,
        throws_other,
        short_read
    };

    failing_source(std::vector<std::byte> data, int succeed_count, failure_kind kind = throws_io)
        : m_inner(std::move(data)), m_remaining(succeed_count), m_kind(kind) {}

    std::uint64_t size() const override { return m_inner.size(); }

    std::vector<std::byte> slice(std::uint64_t start, std::uint64_t end) override {
        if (m_remaining > 0) {
            --m_remaining;
            return m_inner.slice(start, end);
        }
        switch (m_kind) {
            case throws_io:
                BLOB_THROW_IO("Simulated read failure at ", start);
            case throws_other:
                throw std::runtime_error("device unplugged");
            case short_read:
                break;
        }
        auto bytes = m_inner.slice(start, end);
        if (!bytes.empty()) {
            bytes.pop_back();
        }
        return bytes;
    }

    void heal(int succeed_count) { m_remaining = succeed_count; }

private:
    blob::memory_source m_inner;
    int m_remaining;
    failure_kind m_kind;
};

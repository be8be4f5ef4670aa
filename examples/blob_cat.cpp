/**
 * @file blob_cat.cpp
 * @brief Dump a byte range of a file through a chunked stream
 *
 * Only one chunk of the file is held in memory at a time, so this works
 * on files of any size. Output is a hex dump, or raw bytes with --raw.
 */

#include <blob/stream.hh>
#include <blob/exceptions.hh>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <cstdint>

namespace {
    // std::stoull accepts "-1" and wraps it around
    std::uint64_t parse_count(const std::string& option, const std::string& text) {
        auto first = text.find_first_not_of(" \t");
        BLOB_THROW_IF(first != std::string::npos && text[first] == '-', invalid_argument,
                      "Value of ", option, " must not be negative: ", text);
        return std::stoull(text);
    }
}

class BlobDumper {
public:
    BlobDumper(std::uint64_t offset, std::uint64_t length, bool raw)
        : offset_(offset), length_(length), raw_(raw) {}

    void dump(blob::stream& s) {
        if (!raw_) {
            std::cerr << "File: " << s.file_name() << "\n";
            std::cerr << "Size: " << s.size() << " bytes in " << s.chunk_count()
                      << " chunks of " << s.options().chunk_size << " bytes\n\n";
        }

        s.seek(offset_);

        std::vector<std::byte> line(bytes_per_line);
        std::uint64_t position = s.tell();
        std::uint64_t left = length_;
        while (left > 0) {
            std::size_t want = left < bytes_per_line ? static_cast<std::size_t>(left) : bytes_per_line;
            std::size_t got = s.read_into_range(line, 0, want);
            if (got == 0) {
                break;
            }

            if (raw_) {
                std::cout.write(reinterpret_cast<const char*>(line.data()), static_cast<std::streamsize>(got));
            } else {
                display_hex_line(position, line.data(), got);
            }

            position += got;
            left -= got;
        }
        std::cout.flush();
    }

private:
    static constexpr std::size_t bytes_per_line = 16;

    void display_hex_line(std::uint64_t offset, const std::byte* data, std::size_t size) {
        std::cout << std::hex << std::setw(8) << std::setfill('0') << offset << "  ";

        for (std::size_t i = 0; i < bytes_per_line; ++i) {
            if (i < size) {
                std::cout << std::hex << std::setw(2) << std::setfill('0')
                          << std::to_integer<int>(data[i]) << " ";
            } else {
                std::cout << "   ";
            }

            if (i == 7) std::cout << " ";
        }

        std::cout << " |";
        for (std::size_t i = 0; i < size; ++i) {
            char c = static_cast<char>(data[i]);
            if (c >= 32 && c <= 126) {
                std::cout << c;
            } else {
                std::cout << ".";
            }
        }
        std::cout << "|\n" << std::dec;
    }

    std::uint64_t offset_;
    std::uint64_t length_;
    bool raw_;
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <file> [options]\n";
        std::cout << "\n";
        std::cout << "Dump part of a file without loading it into memory.\n";
        std::cout << "\n";
        std::cout << "Options:\n";
        std::cout << "  --offset N       Start at byte N (default 0)\n";
        std::cout << "  --length N       Dump at most N bytes (default: up to EOF)\n";
        std::cout << "  --chunk-size N   Bytes per chunk (default 1024)\n";
        std::cout << "  --raw            Write raw bytes instead of a hex dump\n";
        return 1;
    }

    blob::stream_options options;
    std::uint64_t offset = 0;
    std::uint64_t length = UINT64_MAX;
    bool raw = false;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--raw") {
                raw = true;
            } else if ((arg == "--offset" || arg == "--length" || arg == "--chunk-size") && i + 1 < argc) {
                std::uint64_t value = parse_count(arg, argv[++i]);
                if (arg == "--offset") {
                    offset = value;
                } else if (arg == "--length") {
                    length = value;
                } else {
                    options.chunk_size = static_cast<std::size_t>(value);
                }
            } else {
                std::cerr << "Error: Unknown option '" << arg << "'\n";
                return 1;
            }
        }

        auto s = blob::open_file(argv[1], options);
        BlobDumper dumper(offset, length, raw);
        dumper.dump(*s);
        s->close();
    } catch (const blob::invalid_offset& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

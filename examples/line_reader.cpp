/**
 * @file line_reader.cpp
 * @brief Print lines of a text file through a chunked text stream
 *
 * Warnings reported by the stream (e.g. a file that ends before the
 * requested number of lines) are printed to stderr.
 */

#include <blob/stream.hh>
#include <blob/exceptions.hh>
#include <iostream>
#include <string>
#include <string_view>

namespace {
    std::size_t parse_count(const char* what, const std::string& text) {
        auto first = text.find_first_not_of(" \t");
        BLOB_THROW_IF(first != std::string::npos && text[first] == '-', invalid_argument,
                      "Value of ", what, " must not be negative: ", text);
        return static_cast<std::size_t>(std::stoull(text));
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 5) {
        std::cout << "Usage: " << argv[0] << " <file> [count] [first_line] [chunk_size]\n";
        std::cout << "\n";
        std::cout << "Print <count> lines (default 10) starting at <first_line> (default 1).\n";
        std::cout << "\n";
        std::cout << "Examples:\n";
        std::cout << "  " << argv[0] << " server.log\n";
        std::cout << "  " << argv[0] << " server.log 20 1000 65536\n";
        return 1;
    }

    std::size_t count = 10;
    std::size_t first_line = 1;

    blob::stream_options options;
    options.type = blob::stream_type::text;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    try {
        if (argc >= 3) {
            count = parse_count("count", argv[2]);
        }
        if (argc >= 4) {
            first_line = parse_count("first_line", argv[3]);
        }
        if (argc >= 5) {
            options.chunk_size = parse_count("chunk_size", argv[4]);
        }

        auto s = blob::open_file(argv[1], options);
        auto* text = s->as_text();

        // Skip to the first requested line
        while (text->current_line() + 1 < first_line && !s->eof()) {
            text->read_line();
        }

        auto result = text->read_lines(count);
        std::cout << result.text;
        if (!result.text.empty()) {
            std::cout << "\n";
        }
        return result.truncated ? 3 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

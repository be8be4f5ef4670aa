//
// Created by igor on 19/10/2026.
//

#include <blob/stream_options.hh>
#include <blob/exceptions.hh>

namespace blob {

    void validate(const stream_options& options) {
        BLOB_THROW_IF(options.chunk_size == 0, invalid_configuration,
                      "Chunk size must be at least 1 byte");
        BLOB_THROW_UNLESS(has_flag(options.mode, open_mode::read), invalid_configuration,
                          "Stream mode must include read access");
        BLOB_THROW_IF(has_flag(options.mode, open_mode::write), invalid_configuration,
                      "Write access is not supported by blob streams");
    }

    open_mode parse_open_mode(std::string_view text) {
        BLOB_THROW_IF(text.empty(), invalid_configuration, "Empty stream mode");

        open_mode mode = open_mode::none;
        for (char c : text) {
            switch (c) {
                case 'r':
                    mode = mode | open_mode::read;
                    break;
                case 'w':
                    mode = mode | open_mode::write;
                    break;
                default:
                    BLOB_THROW(invalid_configuration, "Unknown stream mode flag '", c,
                               "' in \"", text, "\"");
            }
        }
        return mode;
    }

    stream_type parse_stream_type(std::string_view text) {
        if (text == "binary") {
            return stream_type::binary;
        }
        if (text == "text") {
            return stream_type::text;
        }
        BLOB_THROW(invalid_configuration, "Unknown stream type \"", text,
                   "\" (expected binary or text)");
    }

    std::string_view to_string(stream_type type) {
        switch (type) {
            case stream_type::binary:
                return "binary";
            case stream_type::text:
                return "text";
        }
        // make compiler happy
        return "unknown";
    }

} // namespace blob

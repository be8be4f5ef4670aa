//
// Created by igor on 19/10/2026.
//

#include <blob/stream.hh>
#include <blob/exceptions.hh>

namespace blob {
    namespace {
        constexpr std::byte line_feed{0x0A};

        stream_options as_text_options(const stream_options& options) {
            stream_options result = options;
            result.type = stream_type::text;
            return result;
        }
    }

    text_stream::text_stream(std::unique_ptr<source> src, const stream_options& options)
        : stream(std::move(src), as_text_options(options))
        , m_current_line(0) {}

    line_result text_stream::read_line() {
        line_result line;
        line.truncated = true;

        while (auto b = read_byte()) {
            if (*b == line_feed) {
                line.truncated = false;
                break;
            }
            line.text.push_back(static_cast<char>(*b));
        }

        ++m_current_line;
        return line;
    }

    line_result text_stream::read_lines(std::size_t count) {
        line_result result;
        std::size_t produced = 0;

        for (std::size_t i = 0; i < count; ++i) {
            line_result line = read_line();

            // Nothing left at all, not even a partial line
            if (line.truncated && line.text.empty()) {
                break;
            }

            if (produced > 0) {
                result.text.push_back('\n');
            }
            result.text += line.text;
            ++produced;

            if (line.truncated) {
                break;
            }
        }

        if (produced < count) {
            result.truncated = true;
            warn("truncated_read", build_error_msg("Reached end of stream after ", produced,
                                                   " of ", count, " requested lines"));
        }
        return result;
    }

} // namespace blob

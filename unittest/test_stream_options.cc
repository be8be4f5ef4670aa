//
// Test option validation, parsing and stream variant selection
//

#include <doctest/doctest.h>
#include <blob/stream.hh>
#include <blob/stream_options.hh>
#include <blob/exceptions.hh>
#include "test_utils.hh"

using namespace blob;

TEST_CASE("stream options - defaults") {
    stream_options opts;
    CHECK(opts.chunk_size == kilobyte);
    CHECK(opts.mode == open_mode::read);
    CHECK(opts.type == stream_type::binary);
    CHECK_FALSE(opts.read_all);
    CHECK(opts.default_file_name == "file");
    CHECK_FALSE(static_cast<bool>(opts.on_warning));
    CHECK_NOTHROW(validate(opts));

    CHECK(megabyte == 1024 * 1024);
    CHECK(gigabyte == (std::size_t(1) << 30));
}

TEST_CASE("stream options - validation") {
    stream_options opts;

    SUBCASE("zero chunk size") {
        opts.chunk_size = 0;
        CHECK_THROWS_AS(validate(opts), invalid_configuration);
        CHECK_THROWS_AS(stream(pattern_source(10), opts), invalid_configuration);
    }

    SUBCASE("mode without read") {
        opts.mode = open_mode::none;
        CHECK_THROWS_AS(validate(opts), invalid_configuration);
    }

    SUBCASE("write access is rejected") {
        opts.mode = open_mode::read | open_mode::write;
        CHECK_THROWS_AS(validate(opts), invalid_configuration);
    }

    SUBCASE("options are checked before the source") {
        opts.chunk_size = 0;
        CHECK_THROWS_AS(stream(nullptr, opts), invalid_configuration);
    }
}

TEST_CASE("stream options - parsing") {
    SUBCASE("modes") {
        CHECK(parse_open_mode("r") == open_mode::read);
        CHECK(parse_open_mode("rw") == (open_mode::read | open_mode::write));
        CHECK(has_flag(parse_open_mode("wr"), open_mode::write));
        CHECK_THROWS_AS(parse_open_mode(""), invalid_configuration);
        CHECK_THROWS_AS(parse_open_mode("rx"), invalid_configuration);
    }

    SUBCASE("types") {
        CHECK(parse_stream_type("binary") == stream_type::binary);
        CHECK(parse_stream_type("text") == stream_type::text);
        CHECK_THROWS_AS(parse_stream_type("utf8"), invalid_configuration);
        CHECK(to_string(stream_type::text) == "text");
        CHECK(to_string(stream_type::binary) == "binary");
    }
}

TEST_CASE("open_stream - variant selection") {
    SUBCASE("binary streams have no line interface") {
        auto s = open_stream(pattern_source(16));
        CHECK(s->type() == stream_type::binary);
        CHECK(s->as_text() == nullptr);
        CHECK(s->readable());
        CHECK_FALSE(s->writable());
    }

    SUBCASE("text streams") {
        stream_options opts;
        opts.type = stream_type::text;
        auto s = open_stream(std::make_unique<memory_source>(std::string("a\nb")), opts);
        REQUIRE(s->as_text() != nullptr);
        CHECK(s->type() == stream_type::text);
        CHECK(s->as_text()->read_line().text == "a");
    }

    SUBCASE("text_stream constructed directly is always text") {
        text_stream s(pattern_source(4));
        CHECK(s.type() == stream_type::text);
        CHECK(s.as_text() == &s);
    }
}

TEST_CASE("stream - file name") {
    SUBCASE("unnamed source uses the default name") {
        auto s = open_stream(pattern_source(4));
        CHECK(s->file_name() == "file");
    }

    SUBCASE("unnamed source with custom default") {
        stream_options opts;
        opts.default_file_name = "capture.bin";
        auto s = open_stream(pattern_source(4), opts);
        CHECK(s->file_name() == "capture.bin");
    }

    SUBCASE("named source overrides the untouched default") {
        auto s = open_file(test_data_path("sample.txt"), stream_options{});
        CHECK(s->file_name() == "sample.txt");
    }

    SUBCASE("custom default wins over the source name") {
        stream_options opts;
        opts.default_file_name = "renamed.txt";
        auto s = open_file(test_data_path("sample.txt"), opts);
        CHECK(s->file_name() == "renamed.txt");
    }
}

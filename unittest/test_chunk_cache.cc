//
// Created by igor on 19/10/2026.
//

#include <doctest/doctest.h>
#include <blob/chunk_cache.hh>
#include <blob/exceptions.hh>
#include <cstring>
#include "test_utils.hh"

using namespace blob;

TEST_CASE("chunk cache - load replaces the slot") {
    auto data = make_pattern(2500);
    counting_source src(data);
    chunk_table table(src.size(), 1024);
    chunk_cache cache(&src, &table);

    CHECK_FALSE(cache.resident());
    CHECK(cache.size() == 0);

    cache.load(1);
    CHECK(cache.resident());
    CHECK(cache.index() == 1);
    REQUIRE(cache.size() == 1024);
    CHECK(std::memcmp(cache.data(), data.data() + 1024, 1024) == 0);
    CHECK(src.last_start() == 1024);

    cache.load(2);
    CHECK(cache.index() == 2);
    REQUIRE(cache.size() == 452);
    CHECK(cache[0] == data[2048]);
    CHECK(cache[451] == data[2499]);
    CHECK(src.slices() == 2);
}

TEST_CASE("chunk cache - failures keep previous contents") {
    auto data = make_pattern(300);
    chunk_table table(data.size(), 100);

    SUBCASE("out of range index") {
        memory_source src(data);
        chunk_cache cache(&src, &table);
        cache.load(0);

        CHECK_THROWS_AS(cache.load(3), chunk_out_of_range);
        CHECK(cache.index() == 0);
        CHECK(cache.size() == 100);
        CHECK(cache[5] == data[5]);
    }

    SUBCASE("source throws io_error") {
        failing_source src(data, 1, failing_source::throws_io);
        chunk_cache cache(&src, &table);
        cache.load(0);

        CHECK_THROWS_AS(cache.load(1), io_error);
        CHECK(cache.index() == 0);
        CHECK(cache[99] == data[99]);
    }

    SUBCASE("source throws something else") {
        failing_source src(data, 1, failing_source::throws_other);
        chunk_cache cache(&src, &table);
        cache.load(0);

        try {
            cache.load(2);
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("chunk 2") != std::string::npos);
            CHECK(msg.find("device unplugged") != std::string::npos);
        }
        CHECK(cache.index() == 0);
    }

    SUBCASE("source returns fewer bytes than the chunk holds") {
        failing_source src(data, 1, failing_source::short_read);
        chunk_cache cache(&src, &table);
        cache.load(0);

        CHECK_THROWS_AS(cache.load(1), io_error);
        CHECK(cache.index() == 0);
        CHECK(cache.size() == 100);
    }
}

TEST_CASE("chunk cache - release") {
    memory_source src(make_pattern(10));
    chunk_table table(src.size(), 4);
    chunk_cache cache(&src, &table);
    cache.load(2);

    cache.release();
    CHECK_FALSE(cache.resident());
    CHECK(cache.size() == 0);
    CHECK_THROWS_AS(cache.load(0), io_error);
}

TEST_CASE("chunk cache - requires a source") {
    chunk_table table(10, 4);
    CHECK_THROWS_AS(chunk_cache(nullptr, &table), invalid_source);
}

#include <doctest/doctest.h>
#include <gavel/sdk/buffer.hh>
#include <cstdint>

using namespace gavel;

TEST_SUITE("Buffer::Unit") {

    TEST_CASE("should_zero_initialize") {
        buffer<float> buf(16);

        CHECK(buf.size() == 16);
        for (float v : buf) {
            CHECK(v == 0.0f);
        }
    }

    TEST_CASE("should_keep_contents_when_growing") {
        buffer<int16_t> buf(2);
        buf[0] = 7;
        buf[1] = -7;

        buf.grow(8);

        CHECK(buf.size() == 8);
        CHECK(buf[0] == 7);
        CHECK(buf[1] == -7);
        CHECK(buf[7] == 0);
    }

    TEST_CASE("should_never_shrink_on_grow") {
        buffer<uint8_t> buf(32);
        buf.grow(4);
        CHECK(buf.size() == 32);
    }

    TEST_CASE("should_discard_contents_on_reset") {
        buffer<uint8_t> buf(4);
        buf[0] = 9;

        buf.reset(2);

        CHECK(buf.size() == 2);
        CHECK(buf[0] == 0);
    }

    TEST_CASE("should_grow_from_empty") {
        buffer<float> buf(0);
        CHECK(buf.size() == 0);

        buf.grow(3);
        CHECK(buf.size() == 3);
        CHECK(buf[2] == 0.0f);
    }
}

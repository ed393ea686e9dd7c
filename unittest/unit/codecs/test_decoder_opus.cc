#include <doctest/doctest.h>
#include <gavel/codecs/decoder_opus.hh>
#include <gavel/sdk/io_stream.hh>
#include <gavel/error.hh>
#include <cstring>
#include <vector>

namespace {
    // First page of an Ogg Opus stream up to the identification magic
    std::vector<uint8_t> opus_first_page() {
        std::vector<uint8_t> page(27 + 1 + 19, 0);
        std::memcpy(page.data(), "OggS", 4);
        page[5] = 0x02;   // beginning of stream
        page[26] = 1;     // one segment
        page[27] = 19;    // OpusHead packet length
        std::memcpy(page.data() + 28, "OpusHead", 8);
        page[36] = 1;     // version
        page[37] = 2;     // channels
        return page;
    }
}

TEST_SUITE("decoder_opus") {
    TEST_CASE("Can create decoder") {
        gavel::decoder_opus decoder;
        CHECK_FALSE(decoder.is_open());
        CHECK(std::string(decoder.get_name()) == "Opus");
        CHECK(decoder.get_rate() == 48000);
    }

    TEST_CASE("Handles invalid data gracefully") {
        gavel::decoder_opus decoder;

        std::vector<uint8_t> invalid_data = {0x00, 0x01, 0x02, 0x03};
        auto io = gavel::io_from_memory(invalid_data.data(), invalid_data.size());

        CHECK_THROWS_AS(decoder.open(io.get()), gavel::decode_error);
        CHECK_FALSE(decoder.is_open());
    }

    TEST_CASE("Rejects empty input") {
        gavel::decoder_opus decoder;
        auto io = gavel::io_from_memory(nullptr, 0);

        CHECK_THROWS_AS(decoder.open(io.get()), gavel::decode_error);
    }

    TEST_CASE("Can query properties when not open") {
        gavel::decoder_opus decoder;

        CHECK(decoder.get_channels() == 0);
        CHECK(decoder.duration() == std::chrono::microseconds(0));
        CHECK_FALSE(decoder.rewind());

        float buf[8] = {};
        bool call_again = true;
        CHECK(decoder.decode(buf, 8, call_again) == 0);
        CHECK_FALSE(call_again);
    }

    TEST_CASE("Recognizes Ogg Opus signatures") {
        SUBCASE("opus_page") {
            auto page = opus_first_page();
            auto io = gavel::io_from_memory(page.data(), page.size());
            CHECK(gavel::decoder_opus::accept(io.get()));
            // accept() leaves the stream where it was
            CHECK(io->tell() == 0);
        }

        SUBCASE("ogg_without_opus") {
            auto page = opus_first_page();
            std::memcpy(page.data() + 28, "\x01vorbis\0", 8);
            auto io = gavel::io_from_memory(page.data(), page.size());
            CHECK_FALSE(gavel::decoder_opus::accept(io.get()));
        }

        SUBCASE("not_ogg") {
            std::vector<uint8_t> riff(64, 0);
            std::memcpy(riff.data(), "RIFF", 4);
            auto io = gavel::io_from_memory(riff.data(), riff.size());
            CHECK_FALSE(gavel::decoder_opus::accept(io.get()));
        }

        SUBCASE("no_stream") {
            CHECK_FALSE(gavel::decoder_opus::accept(nullptr));
        }
    }

    TEST_CASE("Rejects a header-only stream") {
        gavel::decoder_opus decoder;
        auto page = opus_first_page();
        auto io = gavel::io_from_memory(page.data(), page.size());

        CHECK_THROWS_AS(decoder.open(io.get()), gavel::decode_error);
    }
}

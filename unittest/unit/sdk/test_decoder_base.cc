#include <doctest/doctest.h>
#include <gavel/sdk/decoder.hh>
#include "../../mock_components.hh"
#include <vector>

using namespace gavel;
using namespace gavel::test;

TEST_SUITE("Decoder::Unit") {

    TEST_CASE("should_decode_nothing_until_opened") {
        mock_decoder dec(std::make_shared<mock_decoder_stats>());
        float buf[16] = {};
        bool call_again = true;

        CHECK_FALSE(dec.is_open());
        CHECK(dec.decode(buf, 16, call_again) == 0);
        CHECK_FALSE(call_again);
    }

    TEST_CASE("should_hand_out_whole_frames_only") {
        auto stats = std::make_shared<mock_decoder_stats>();
        mock_decoder dec(stats);
        auto bytes = encode_pcm(100, 2);
        auto stream = io_from_memory(bytes.data(), bytes.size());
        dec.open(stream.get());
        float buf[16] = {};
        bool call_again = false;

        // Act: an odd length cannot hold a whole stereo frame at the end
        auto got = dec.decode(buf, 7, call_again);

        // Assert
        CHECK(got == 6);
        CHECK(call_again);
    }

    TEST_CASE("should_report_format_and_duration") {
        mock_decoder dec(std::make_shared<mock_decoder_stats>());
        auto bytes = encode_pcm(24000, 1, 48000);
        auto stream = io_from_memory(bytes.data(), bytes.size());

        dec.open(stream.get());

        CHECK(dec.is_open());
        CHECK(dec.get_channels() == 1);
        CHECK(dec.get_rate() == 48000);
        CHECK(dec.duration() == std::chrono::microseconds(500000));

        dec.close();
        CHECK_FALSE(dec.is_open());
    }

    TEST_CASE("should_reject_null_or_empty_output") {
        mock_decoder dec(std::make_shared<mock_decoder_stats>());
        auto bytes = encode_pcm(10, 1);
        auto stream = io_from_memory(bytes.data(), bytes.size());
        dec.open(stream.get());
        bool call_again = true;

        CHECK(dec.decode(nullptr, 8, call_again) == 0);
        float buf[1] = {};
        CHECK(dec.decode(buf, 0, call_again) == 0);
    }
}

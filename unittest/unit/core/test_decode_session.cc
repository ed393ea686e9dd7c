#include <doctest/doctest.h>
#include <gavel/decode_session.hh>
#include <gavel/error.hh>
#include "../../mock_components.hh"

using namespace gavel;
using namespace gavel::test;

TEST_SUITE("DecodeSession::Unit") {

    TEST_CASE("should_refuse_a_factory_without_decoder") {
        CHECK_THROWS_AS(decode_session(nullptr), decode_error);
        CHECK_THROWS_AS(decode_session([] { return std::unique_ptr<decoder>(); }), decode_error);
    }

    TEST_CASE("should_split_interleaved_output_per_channel") {
        auto stats = std::make_shared<mock_decoder_stats>();
        decode_session session(mock_decoder_factory(stats));

        // more frames than one decode block
        auto audio = session.decode(encode_pcm(20000, 2, 44100, 0.75f));

        CHECK(audio.frames == 20000);
        CHECK(audio.sample_rate == 44100);
        REQUIRE(audio.channel_data.size() == 2);
        CHECK(audio.channel_data[0].size() == 20000);
        CHECK(audio.channel_data[1].back() == doctest::Approx(0.75f));
        CHECK(session.decodes() == 1);
        CHECK(std::string(session.decoder_name()) == "Mock Decoder");
    }

    TEST_CASE("should_reuse_one_decoder_for_many_files") {
        auto stats = std::make_shared<mock_decoder_stats>();
        decode_session session(mock_decoder_factory(stats));

        (void)session.decode(encode_pcm(10));
        session.reset();
        (void)session.decode(encode_pcm(20));
        session.reset();

        CHECK(stats->created == 1);
        CHECK(stats->opens == 2);
        CHECK(stats->closes == 2);
        CHECK(session.decodes() == 2);
    }

    TEST_CASE("should_propagate_decoder_rejections") {
        decode_session session(mock_decoder_factory(std::make_shared<mock_decoder_stats>()));
        std::vector<uint8_t> junk = {'n', 'o', 'p', 'e'};

        CHECK_THROWS_AS((void)session.decode(junk), decode_error);
        CHECK_NOTHROW(session.reset());
    }

    TEST_CASE("should_report_zero_frames_for_empty_audio") {
        decode_session session(mock_decoder_factory(std::make_shared<mock_decoder_stats>()));

        auto audio = session.decode(encode_pcm(0, 1));

        CHECK(audio.frames == 0);
    }
}

/**
 * @file test_audio_context.cc
 * @brief Unit tests for the output context and its buffer sources
 *
 * Test Coverage:
 * - Device lifecycle and state transitions
 * - Mixing, gain and channel mapping
 * - Integer output conversion
 * - End-of-buffer notification
 */

#include <doctest/doctest.h>
#include <gavel/audio_context.hh>
#include <gavel/error.hh>
#include "../../test_fixtures.hh"
#include <cstring>

using namespace gavel;
using namespace gavel::test;

TEST_SUITE("AudioContext::Unit") {

    TEST_CASE("should_refuse_unusable_backends") {
        event_loop loop;

        SUBCASE("null_backend") {
            CHECK_THROWS_AS(audio_context(loop, nullptr, test_spec), device_error);
        }

        SUBCASE("uninitialized_backend") {
            auto backend = std::make_shared<mock_backend>();
            CHECK_THROWS_AS(audio_context(loop, backend, test_spec), device_error);
        }

        SUBCASE("device_refused") {
            auto backend = create_initialized_mock_backend();
            backend->fail_open = true;
            CHECK_THROWS_AS(audio_context(loop, backend, test_spec), device_error);
        }

        SUBCASE("stream_refused") {
            auto backend = create_initialized_mock_backend();
            backend->fail_stream = true;
            CHECK_THROWS_AS(audio_context(loop, backend, test_spec), device_error);
            CHECK(backend->open_devices() == 0);
        }
    }

    TEST_CASE_FIXTURE(context_fixture, "should_start_suspended_and_resume_on_request") {
        CHECK(context.get_state() == audio_context::state::suspended);
        CHECK(stream().is_paused());

        bool done = false;
        context.resume([&] { done = true; });

        CHECK(context.get_state() == audio_context::state::running);
        CHECK_FALSE(stream().is_paused());
        CHECK_FALSE(done);
        loop.run_pending();
        CHECK(done);

        context.suspend();
        CHECK(context.get_state() == audio_context::state::suspended);
    }

    TEST_CASE_FIXTURE(context_fixture, "should_close_the_device_once") {
        context.close();
        context.close();

        CHECK(context.get_state() == audio_context::state::closed);
        CHECK(backend->close_device_calls == 1);
        CHECK(backend->open_devices() == 0);
    }

    TEST_CASE_FIXTURE(context_fixture, "should_render_silence_without_sources") {
        auto out = stream().pump_float(64);

        REQUIRE(out.size() == 128);
        for (float s : out) {
            CHECK(s == 0.0f);
        }
        CHECK(context.current_time() == doctest::Approx(64.0 / 48000.0));
    }

    TEST_CASE_FIXTURE(context_fixture, "should_mix_sources_with_their_gain") {
        // Arrange
        auto a = context.create_buffer_source(make_pcm(1000, 1, 48000, 0.5f), context.create_gain(0.5f));
        auto b = context.create_buffer_source(make_pcm(1000, 2, 48000, 0.25f), nullptr);
        a->start(0.0);
        b->start(0.0);

        // Act
        auto out = stream().pump_float(10);

        // Assert: mono is copied to both outputs
        CHECK(out[0] == doctest::Approx(0.5f * 0.5f + 0.25f));
        CHECK(out[1] == doctest::Approx(0.5f * 0.5f + 0.25f));
        CHECK(context.active_sources() == 2);
    }

    TEST_CASE_FIXTURE(context_fixture, "should_apply_gain_changes_immediately") {
        auto gain = context.create_gain(1.0f);
        auto node = context.create_buffer_source(make_pcm(1000, 1, 48000, 1.0f), gain);
        node->start(0.0);

        gain->set_gain(0.0f);
        auto out = stream().pump_float(4);

        CHECK(out[0] == 0.0f);
    }

    TEST_CASE_FIXTURE(context_fixture, "should_resample_to_the_output_rate") {
        // 24 kHz source plays at half speed per output frame
        auto node = context.create_buffer_source(make_pcm(240, 1, 24000), nullptr);
        node->start(0.0);

        stream().pump(240);
        CHECK(node->active());

        stream().pump(240);
        CHECK_FALSE(node->active());
    }

    TEST_CASE("should_convert_to_signed_16_bit_output") {
        auto clock = std::make_shared<manual_clock>();
        event_loop loop(clock);
        auto backend = create_initialized_mock_backend();
        audio_context context(loop, backend, audio_spec{audio_format::s16le, 1, 48000});

        auto loud = context.create_buffer_source(make_pcm(100, 1, 48000, 2.0f), nullptr);
        loud->start(0.0);
        const auto& bytes = backend->last_stream->pump(4);

        REQUIRE(bytes.size() == 8);
        int16_t first = 0;
        std::memcpy(&first, bytes.data(), sizeof(first));
        CHECK(first == 32767);
    }

    TEST_CASE_FIXTURE(context_fixture, "should_notify_on_the_loop_when_a_buffer_ends") {
        auto node = context.create_buffer_source(make_pcm(100), nullptr);
        int ended = 0;
        node->set_on_ended([&] { ended++; });
        node->start(0.0);

        stream().pump(128);
        CHECK(ended == 0);
        CHECK_FALSE(node->active());

        loop.run_pending();
        CHECK(ended == 1);

        stream().pump(128);
        loop.run_pending();
        CHECK(ended == 1);
    }

    TEST_CASE_FIXTURE(context_fixture, "should_not_notify_when_stopped") {
        auto node = context.create_buffer_source(make_pcm(100), nullptr);
        int ended = 0;
        node->set_on_ended([&] { ended++; });
        node->start(0.0);

        node->stop();
        stream().pump(256);
        loop.run_pending();

        CHECK(ended == 0);
        CHECK(context.active_sources() == 0);
    }

    TEST_CASE_FIXTURE(context_fixture, "should_start_each_node_only_once") {
        auto node = context.create_buffer_source(make_pcm(100), nullptr);

        node->start(0.0);
        node->stop();
        node->start(0.0);

        CHECK_FALSE(node->active());
        CHECK(context.active_sources() == 0);
    }

    TEST_CASE_FIXTURE(context_fixture, "should_loop_until_stopped") {
        auto node = context.create_buffer_source(make_pcm(100), nullptr);
        int ended = 0;
        node->set_on_ended([&] { ended++; });
        node->set_loop(true);
        node->start(0.0);

        stream().pump(1000);
        loop.run_pending();

        CHECK(ended == 0);
        CHECK(node->active());
    }

    TEST_CASE_FIXTURE(context_fixture, "should_reject_null_buffers") {
        CHECK_THROWS_AS((void)context.create_buffer_source(nullptr, nullptr), std::invalid_argument);
    }
}

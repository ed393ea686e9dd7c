/**
 * @file test_remote_offset_sync.cc
 * @brief Unit tests for seeking channels to a server-supplied offset
 */

#include <doctest/doctest.h>
#include <gavel/remote_offset_sync.hh>
#include <gavel/channel_router.hh>
#include <gavel/capability_probe.hh>
#include "../../test_fixtures.hh"
#include <map>

using namespace gavel;
using namespace gavel::test;
using namespace std::chrono_literals;

TEST_SUITE("RemoteOffsetSync::Unit") {

    TEST_CASE("should_parse_offset_and_channel_fields") {
        SUBCASE("well_formed") {
            auto cmd = parse_remote_offset_command({"RMC", "5.5", "1"});
            CHECK(cmd.offset_seconds == doctest::Approx(5.5));
            CHECK(cmd.channel == 1);
        }

        SUBCASE("missing_fields_default_to_zero") {
            auto cmd = parse_remote_offset_command({"RMC"});
            CHECK(cmd.offset_seconds == 0.0);
            CHECK(cmd.channel == 0);
        }

        SUBCASE("garbage_defaults_to_zero") {
            auto cmd = parse_remote_offset_command({"RMC", "abc", "x"});
            CHECK(cmd.offset_seconds == 0.0);
            CHECK(cmd.channel == 0);
        }

        SUBCASE("surrounding_whitespace_is_ignored") {
            auto cmd = parse_remote_offset_command({"RMC", "  2.5 ", " 3"});
            CHECK(cmd.offset_seconds == doctest::Approx(2.5));
            CHECK(cmd.channel == 3);
        }

        SUBCASE("non_finite_offsets_become_zero") {
            auto cmd = parse_remote_offset_command({"RMC", "inf", "0"});
            CHECK(cmd.offset_seconds == 0.0);
        }

        SUBCASE("fractional_channels_match_nothing") {
            auto cmd = parse_remote_offset_command({"RMC", "1", "1.5"});
            CHECK(cmd.channel == -1);
        }
    }

    TEST_CASE("should_seek_native_channels_on_metadata_with_drift") {
        // Arrange
        auto clock = std::make_shared<manual_clock>();
        event_loop loop(clock);
        auto native = std::make_shared<mock_native_handle>();
        native->play();
        remote_offset_sync sync(loop, [&](int index) {
            return index == 0 ? std::shared_ptr<playback_handle>(native) : nullptr;
        });

        // Act
        sync.apply_remote_offset(0, 5.0);

        // Assert: paused until the metadata arrives
        CHECK(native->paused());
        CHECK(native->seeks.empty());

        clock->advance(300ms);
        native->notify(playback_event::loaded_metadata);

        REQUIRE(native->seeks.size() == 1);
        CHECK(native->seeks[0] == doctest::Approx(5.3));
        CHECK_FALSE(native->paused());
        CHECK(native->play_calls == 2);
    }

    TEST_CASE("should_seek_native_channels_only_once") {
        auto clock = std::make_shared<manual_clock>();
        event_loop loop(clock);
        auto native = std::make_shared<mock_native_handle>();
        const auto listeners_before = native->listener_count();
        remote_offset_sync sync(loop, [&](int) { return native; });

        sync.apply_remote_offset(0, 1.0);
        native->notify(playback_event::loaded_metadata);
        native->notify(playback_event::loaded_metadata);

        CHECK(native->seeks.size() == 1);
        CHECK(native->listener_count() == listeners_before);
    }

    TEST_CASE("should_ignore_unknown_channels") {
        auto clock = std::make_shared<manual_clock>();
        event_loop loop(clock);
        int lookups = 0;
        remote_offset_sync sync(loop, [&](int) {
            lookups++;
            return std::shared_ptr<playback_handle>();
        });

        CHECK_NOTHROW(sync.apply(parse_remote_offset_command({"RMC", "5", "1.5"})));
        CHECK_NOTHROW(sync.apply_remote_offset(42, 5.0));

        CHECK(lookups == 2);
        CHECK(loop.idle());
    }

    TEST_CASE_FIXTURE(decoder_fixture, "should_seek_software_channels_after_the_readiness_delay") {
        // Arrange
        fetcher.add_pcm("a.opus", 480000);
        auto handle = make_handle();
        handle->set_source("a.opus");
        drain();
        remote_offset_sync sync(loop, [&](int) { return handle; });
        REQUIRE(sync.readiness_delay() == 100ms);

        // Act
        sync.apply_remote_offset(0, 5.0);
        clock->advance(99ms);
        loop.run_pending();
        CHECK(handle->current_time() == 0.0);

        clock->advance(1ms);
        loop.run_pending();

        // Assert
        CHECK(handle->current_time() == doctest::Approx(5.1));
        drain();
        CHECK_FALSE(handle->paused());
    }

    TEST_CASE_FIXTURE(decoder_fixture, "should_honour_a_configured_readiness_delay") {
        fetcher.add_pcm("a.opus", 480000);
        auto handle = make_handle();
        handle->set_source("a.opus");
        drain();
        remote_offset_sync sync(loop, [&](int) { return handle; }, 250ms);

        sync.apply_remote_offset(0, 2.0);
        clock->advance(250ms);
        loop.run_pending();

        CHECK(handle->current_time() == doctest::Approx(2.25));
    }

    TEST_CASE_FIXTURE(decoder_fixture, "should_use_metadata_for_routed_channels_playing_natively") {
        capability_probe probe(no_opus_host());
        channel_router router(probe, [this]() {
            return std::shared_ptr<playback_handle>(make_handle());
        });
        auto native = std::make_shared<mock_native_handle>();
        auto routed = router.wrap(native);
        routed->set_source("music/theme.mp3");
        remote_offset_sync sync(loop, [&](int) { return routed; });

        sync.apply_remote_offset(0, 7.0);
        clock->advance(500ms);
        loop.run_pending();
        CHECK(native->seeks.empty());

        native->notify(playback_event::loaded_metadata);

        REQUIRE(native->seeks.size() == 1);
        CHECK(native->seeks[0] == doctest::Approx(7.5));
        CHECK(native->play_calls == 1);
    }
}

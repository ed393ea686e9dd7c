/**
 * @file test_playback_handle.cc
 * @brief Unit tests for listener bookkeeping and source classification
 */

#include <doctest/doctest.h>
#include <gavel/playback_handle.hh>
#include "../../mock_components.hh"
#include <cmath>
#include <limits>
#include <sstream>

using namespace gavel;
using namespace gavel::test;

TEST_SUITE("PlaybackHandle::Unit") {

    TEST_CASE("should_classify_sources_by_extension") {
        CHECK(is_software_source("music/track.opus"));
        CHECK(is_software_source("https://assets.example/a.opus"));
        CHECK_FALSE(is_software_source("music/track.mp3"));
        CHECK_FALSE(is_software_source("music/track.opus.mp3"));
        CHECK_FALSE(is_software_source("opus"));
        CHECK_FALSE(is_software_source(""));
    }

    TEST_CASE("should_clamp_volumes") {
        CHECK(clamp_volume(0.5f) == doctest::Approx(0.5f));
        CHECK(clamp_volume(3.0f) == 1.0f);
        CHECK(clamp_volume(-1.0f) == 0.0f);
        CHECK(clamp_volume(std::numeric_limits<float>::quiet_NaN()) == 0.0f);
    }

    TEST_CASE("should_name_events_like_media_elements") {
        CHECK(std::string(to_string(playback_event::loaded_metadata)) == "loadedmetadata");
        std::ostringstream os;
        os << playback_event::ended;
        CHECK(os.str() == "ended");
    }

    TEST_CASE("should_deliver_events_to_matching_listeners") {
        mock_native_handle handle;
        int plays = 0;
        int errors = 0;
        handle.add_listener(playback_event::play, [&](playback_event) { plays++; });
        handle.add_listener(playback_event::error, [&](playback_event) { errors++; });

        handle.notify(playback_event::play);
        handle.notify(playback_event::play);

        CHECK(plays == 2);
        CHECK(errors == 0);
        CHECK(handle.kind() == handle_kind::native);
        CHECK(handle.active_kind() == handle_kind::native);
    }

    TEST_CASE("should_stop_delivering_after_removal") {
        mock_native_handle handle;
        int calls = 0;
        auto id = handle.add_listener(playback_event::ended, [&](playback_event) { calls++; });

        handle.remove_listener(id);
        handle.notify(playback_event::ended);

        CHECK(calls == 0);
        CHECK(handle.listener_count() == 0);
    }

    TEST_CASE("should_allow_listeners_to_remove_themselves_and_others") {
        mock_native_handle handle;
        int first = 0;
        int second = 0;
        playback_handle::listener_id second_id = 0;
        auto first_id = std::make_shared<playback_handle::listener_id>(0);

        *first_id = handle.add_listener(playback_event::loaded, [&, first_id](playback_event) {
            first++;
            handle.remove_listener(*first_id);
            handle.remove_listener(second_id);
        });
        second_id = handle.add_listener(playback_event::loaded, [&](playback_event) { second++; });

        handle.notify(playback_event::loaded);
        handle.notify(playback_event::loaded);

        CHECK(first == 1);
        CHECK(second == 0);
    }
}

/**
 * @file test_channel_pool.cc
 * @brief Unit tests for channel pools and the courtroom channel set
 */

#include <doctest/doctest.h>
#include <gavel/channel_pool.hh>
#include <gavel/channel_router.hh>
#include <gavel/capability_probe.hh>
#include "../../test_fixtures.hh"
#include <string>
#include <vector>

using namespace gavel;
using namespace gavel::test;

namespace {
    std::vector<std::shared_ptr<mock_native_handle>> make_natives(size_t n) {
        std::vector<std::shared_ptr<mock_native_handle>> out;
        for (size_t i = 0; i < n; i++) {
            out.push_back(std::make_shared<mock_native_handle>());
        }
        return out;
    }

    std::vector<std::shared_ptr<playback_handle>> as_handles(
        const std::vector<std::shared_ptr<mock_native_handle>>& natives) {
        return {natives.begin(), natives.end()};
    }

    host_channels make_host(const std::vector<std::shared_ptr<mock_native_handle>>& music,
                            const std::vector<std::shared_ptr<mock_native_handle>>& blips) {
        host_channels host;
        host.music = as_handles(music);
        host.blips = as_handles(blips);
        host.sfx = std::make_shared<mock_native_handle>();
        host.shout = std::make_shared<mock_native_handle>();
        host.testimony = std::make_shared<mock_native_handle>();
        return host;
    }
}

TEST_SUITE("ChannelPool::Unit") {

    TEST_CASE("should_look_up_channels_by_index") {
        auto natives = make_natives(3);
        channel_pool pool(as_handles(natives));

        CHECK(pool.size() == 3);
        CHECK(pool.at(0) == natives[0]);
        CHECK(pool.at(2) == natives[2]);
        CHECK(pool.at(3) == nullptr);
        CHECK(pool.at(-1) == nullptr);
    }

    TEST_CASE("should_hand_out_paused_channels_round_robin") {
        auto natives = make_natives(3);
        channel_pool pool(as_handles(natives));

        CHECK(pool.next() == natives[0]);
        CHECK(pool.next() == natives[1]);
        CHECK(pool.next() == natives[2]);
        CHECK(pool.next() == natives[0]);
    }

    TEST_CASE("should_skip_playing_channels") {
        auto natives = make_natives(3);
        channel_pool pool(as_handles(natives));
        natives[0]->play();
        natives[1]->play();

        CHECK(pool.next() == natives[2]);
        CHECK(pool.next() == natives[2]);
    }

    TEST_CASE("should_fall_back_to_the_cursor_when_all_are_playing") {
        auto natives = make_natives(2);
        channel_pool pool(as_handles(natives));
        natives[0]->play();
        natives[1]->play();

        CHECK(pool.next() == natives[0]);
        CHECK(pool.next() == natives[1]);
    }

    TEST_CASE("should_return_nothing_from_an_empty_pool") {
        channel_pool pool;
        CHECK(pool.empty());
        CHECK(pool.next() == nullptr);
    }

    TEST_CASE_FIXTURE(decoder_fixture, "should_build_native_courtroom_channels") {
        // Arrange
        capability_probe probe(native_opus_host());
        channel_router router(probe, [this]() {
            return std::shared_ptr<playback_handle>(make_handle());
        });
        auto music = make_natives(4);
        auto blips = make_natives(2);
        auto host = make_host(music, blips);
        auto sfx = std::static_pointer_cast<mock_native_handle>(host.sfx);

        // Act
        courtroom_channels channels(router, host, "https://assets.example/");

        // Assert
        CHECK(channels.music().size() == 4);
        CHECK(channels.blips().size() == 2);
        CHECK(channels.music_channel(0) == music[0]);
        CHECK(music[3]->volume() == doctest::Approx(0.5f));
        CHECK(blips[1]->volume() == doctest::Approx(0.5f));
        CHECK(channels.sfx() == sfx);
        CHECK(sfx->source() == "https://assets.example/sounds/general/sfx-realization.opus");
        CHECK(channels.shout()->source() == "https://assets.example/misc/default/objection.opus");
        CHECK(channels.testimony()->source() == "https://assets.example/sounds/general/sfx-guilty.opus");
    }

    TEST_CASE_FIXTURE(decoder_fixture, "should_give_software_companions_the_default_sources") {
        capability_probe probe(no_opus_host());
        channel_router router(probe, [this]() {
            return std::shared_ptr<playback_handle>(make_handle());
        });
        auto host = make_host(make_natives(1), make_natives(1));

        courtroom_channels channels(router, host, "assets/");
        drain();

        auto sfx = std::dynamic_pointer_cast<routed_handle>(channels.sfx());
        REQUIRE(sfx);
        CHECK(sfx->software()->source() == "assets/sounds/general/sfx-realization.opus");
        CHECK(sfx->native()->source() == "assets/sounds/general/sfx-realization.opus");
        CHECK(sfx->active_kind() == handle_kind::software);
        CHECK(fetcher.fetch_count("assets/misc/default/objection.opus") == 1);
    }

    TEST_CASE_FIXTURE(decoder_fixture, "should_apply_and_clamp_channel_volumes") {
        capability_probe probe(native_opus_host());
        channel_router router(probe, nullptr);
        auto music = make_natives(2);
        auto blips = make_natives(2);

        courtroom_channels channels(router, make_host(music, blips), "", 0.8f, 0.1f);
        CHECK(music[0]->volume() == doctest::Approx(0.8f));
        CHECK(blips[0]->volume() == doctest::Approx(0.1f));

        channels.set_music_volume(2.0f);
        channels.set_blip_volume(0.3f);
        CHECK(music[1]->volume() == doctest::Approx(1.0f));
        CHECK(blips[1]->volume() == doctest::Approx(0.3f));
    }

    TEST_CASE_FIXTURE(decoder_fixture, "should_report_channel_errors_by_name") {
        capability_probe probe(native_opus_host());
        channel_router router(probe, nullptr);
        auto music = make_natives(1);
        auto blips = make_natives(1);
        std::vector<std::string> reported;

        courtroom_channels channels(router, make_host(music, blips), "", 0.5f, 0.5f,
                                    [&](const std::string& name, playback_handle&) {
                                        reported.push_back(name);
                                    });
        music[0]->fail("network");
        blips[0]->fail("network");

        CHECK(reported == std::vector<std::string>{"music", "blip"});
    }
}

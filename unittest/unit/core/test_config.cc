#include <doctest/doctest.h>
#include <gavel/config.hh>
#include <cstdlib>

using namespace gavel;
using namespace std::chrono_literals;

TEST_SUITE("EngineConfig::Unit") {

    TEST_CASE("should_default_to_stereo_float_at_48k") {
        engine_config cfg;

        CHECK(cfg.output.format == audio_format::f32le);
        CHECK(cfg.output.channels == 2);
        CHECK(cfg.output.freq == 48000);
        CHECK(cfg.readiness_delay == 100ms);
        CHECK(cfg.music_volume == doctest::Approx(0.5f));
        CHECK(cfg.blip_volume == doctest::Approx(0.5f));
        CHECK(cfg.native_mime_types.empty());
    }

    TEST_CASE("should_read_overrides_from_the_environment") {
        SUBCASE("valid_values") {
            setenv("GAVEL_ASSET_ROOT", "/srv/assets", 1);
            setenv("GAVEL_READINESS_DELAY_MS", "250", 1);

            auto cfg = engine_config::from_environment();

            CHECK(cfg.asset_root == "/srv/assets");
            CHECK(cfg.readiness_delay == 250ms);
        }

        SUBCASE("invalid_delay_is_ignored") {
            unsetenv("GAVEL_ASSET_ROOT");
            setenv("GAVEL_READINESS_DELAY_MS", "soon", 1);

            auto cfg = engine_config::from_environment();

            CHECK(cfg.asset_root.empty());
            CHECK(cfg.readiness_delay == 100ms);
        }

        unsetenv("GAVEL_ASSET_ROOT");
        unsetenv("GAVEL_READINESS_DELAY_MS");
    }
}

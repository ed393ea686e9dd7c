#include <doctest/doctest.h>
#include <gavel_backends/sdl3/sdl3_backend.hh>
#include <gavel/audio_context.hh>
#include <gavel/event_loop.hh>
#include <memory>

using namespace gavel;

TEST_SUITE("SDL3Backend") {
    TEST_CASE("SDL3 backend creation") {
        auto backend = create_sdl3_backend();
        CHECK(backend != nullptr);
        CHECK_FALSE(backend->is_initialized());
        CHECK(backend->get_name() == "SDL3");
    }

    TEST_CASE("SDL3 initialization lifecycle") {
        auto backend = create_sdl3_backend();

        backend->init();
        CHECK(backend->is_initialized());
        CHECK_THROWS(backend->init());

        backend->shutdown();
        CHECK_FALSE(backend->is_initialized());
        CHECK_NOTHROW(backend->shutdown());
    }

    TEST_CASE("SDL3 device open and close") {
        auto backend = create_sdl3_backend();
        audio_spec obtained{};
        CHECK_THROWS(backend->open_device("default", audio_spec{audio_format::f32le, 2, 48000}, obtained));

        backend->init();
        auto handle = backend->open_device("default", audio_spec{audio_format::f32le, 2, 48000}, obtained);
        CHECK(handle != 0);
        CHECK(obtained.format == audio_format::f32le);
        CHECK(obtained.channels == 2);
        CHECK(obtained.freq == 48000);

        backend->close_device(handle);
        CHECK_NOTHROW(backend->close_device(handle));
        backend->shutdown();
    }

    TEST_CASE("SDL3 stream creation") {
        auto backend = create_sdl3_backend();
        backend->init();
        audio_spec spec{audio_format::s16le, 2, 44100};
        audio_spec obtained{};
        auto handle = backend->open_device("default", spec, obtained);

        auto stream = backend->create_stream(handle, obtained, [](void*, uint8_t*, int) {}, nullptr);
        REQUIRE(stream);
        CHECK(stream->is_paused());
        CHECK(stream->resume());
        CHECK_FALSE(stream->is_paused());
        CHECK(stream->pause());

        CHECK_THROWS(backend->create_stream(handle + 100, obtained, [](void*, uint8_t*, int) {}, nullptr));

        stream.reset();
        backend->close_device(handle);
        backend->shutdown();
    }

    TEST_CASE("SDL3 drives an audio context") {
        auto backend = create_sdl3_backend();
        backend->init();
        event_loop loop;

        {
            audio_context context(loop, backend, audio_spec{audio_format::f32le, 2, 48000});
            CHECK(context.get_state() == audio_context::state::suspended);
            context.resume();
            CHECK(context.get_state() == audio_context::state::running);
        }

        backend->shutdown();
    }
}

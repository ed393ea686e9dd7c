/**
 * @example 01_play_channel.cc
 * @brief Play an Opus file on a software channel, optionally from a server offset
 *
 * Usage: 01_play_channel <file.opus> [offset_seconds]
 *
 * With an offset the file is started the way an RMC message would start it:
 * paused, seeked to the offset plus the time spent getting ready, then played.
 */

#include <gavel/audio_engine.hh>
#include <gavel/audio_context.hh>
#include <gavel/error.hh>
#include <gavel/event_loop.hh>
#include <gavel/remote_offset_sync.hh>
#include <gavel/software_handle.hh>
#include <gavel_backends/sdl3/sdl3_backend.hh>
#include <chrono>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <file.opus> [offset_seconds]\n";
        return 1;
    }

    try {
        gavel::event_loop loop;
        auto cfg = gavel::engine_config::from_environment();
        gavel::audio_engine engine(loop, gavel::create_sdl3_backend(), cfg);
        engine.notify_user_interaction();

        auto channel = engine.create_software_handle();
        bool finished = false;
        channel->add_listener(gavel::playback_event::ended, [&](gavel::playback_event) {
            std::cout << "Playback finished\n";
            finished = true;
        });
        channel->add_listener(gavel::playback_event::error, [&](gavel::playback_event) {
            std::cerr << "Error: " << gavel::describe_error(channel->error()) << '\n';
            finished = true;
        });
        channel->add_listener(gavel::playback_event::loaded, [&](gavel::playback_event) {
            std::cout << "Loaded " << channel->source() << ": " << channel->duration() << " s\n";
        });

        channel->set_source(argv[1]);

        if (argc == 3) {
            gavel::remote_offset_sync sync(loop, [&](int) { return channel; }, cfg.readiness_delay);
            sync.apply(gavel::parse_remote_offset_command({"RMC", argv[2], "0"}));
        } else {
            channel->play();
        }

        loop.run_until([&] { return finished; }, std::chrono::hours(1));
    } catch (const gavel::device_error& e) {
        std::cerr << "Device error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}

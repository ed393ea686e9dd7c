#ifndef GAVEL_TEST_FIXTURES_HH
#define GAVEL_TEST_FIXTURES_HH

#include <gavel/audio_context.hh>
#include <gavel/event_loop.hh>
#include <gavel/software_decoder.hh>
#include <gavel/software_handle.hh>
#include <chrono>
#include <memory>
#include "mock_backends.hh"
#include "mock_components.hh"
#include <doctest/doctest.h>

namespace gavel::test {
    constexpr audio_spec test_spec{audio_format::f32le, 2, 48000};

    // Loop on a manual clock plus an output context on the mock backend
    class context_fixture {
        protected:
            std::shared_ptr <manual_clock> clock = std::make_shared <manual_clock>();
            event_loop loop{clock};
            std::shared_ptr <mock_backend> backend = create_initialized_mock_backend();
            audio_context context{loop, backend, test_spec};

        public:
            mock_stream& stream() {
                REQUIRE(backend->last_stream != nullptr);
                return *backend->last_stream;
            }

            // Run the loop, moving the clock forward whenever only timers remain
            void drain(std::chrono::milliseconds step = std::chrono::milliseconds(10), int max_steps = 200) {
                for (int i = 0; i < max_steps; i++) {
                    loop.run_pending();
                    if (loop.idle()) {
                        return;
                    }
                    clock->advance(step);
                }
                loop.run_pending();
            }

            // Render @p frames on the audio side and deliver what it posted
            void render(size_t frames) {
                stream().pump(frames);
                loop.run_pending();
            }
    };

    // context_fixture plus a software decoder on canned responses
    class decoder_fixture : public context_fixture {
        protected:
            mock_fetcher fetcher{loop};
            std::shared_ptr <mock_decoder_stats> stats = std::make_shared <mock_decoder_stats>();
            software_decoder decoder{loop, fetcher, mock_decoder_factory(stats)};

        public:
            std::shared_ptr <software_handle> make_handle() {
                return std::make_shared <software_handle>(context, decoder);
            }
    };
}

#endif // GAVEL_TEST_FIXTURES_HH

/**
 * @file sdl3_backend.hh
 * @brief SDL3 audio backend factory
 * @ingroup backends
 */

#ifndef GAVEL_BACKENDS_SDL3_BACKEND_HH
#define GAVEL_BACKENDS_SDL3_BACKEND_HH

#include <memory>

#include "export_gavel_backend_sdl3.h"

namespace gavel {

/**
 * @defgroup sdl3_backend SDL3 Audio Backend
 * @ingroup backends
 * @brief Output through SDL3's audio stream API
 *
 * The backend opens a logical playback device and binds one
 * SDL_AudioStream to it. SDL pulls data through the stream's get
 * callback, which in turn calls the render callback of the output
 * context; SDL converts to the device format where needed.
 *
 * ## Configuration
 *
 * The usual SDL environment variables apply:
 * - `SDL_AUDIO_DRIVER`: force a specific driver
 * - `SDL_AUDIO_DEVICE_SAMPLE_FRAMES`: period size hint
 *
 * @{
 */

class audio_backend;

/**
 * @brief Create an SDL3 audio backend instance
 * @return New, uninitialized backend
 *
 * @code
 * #include <gavel_backends/sdl3/sdl3_backend.hh>
 *
 * gavel::event_loop loop;
 * gavel::audio_engine engine(loop, gavel::create_sdl3_backend());
 * @endcode
 *
 * @see audio_backend, audio_engine
 */
GAVEL_BACKEND_SDL3_EXPORT std::shared_ptr<audio_backend> create_sdl3_backend();

/** @} */ // end of sdl3_backend group

} // namespace gavel

#endif // GAVEL_BACKENDS_SDL3_BACKEND_HH

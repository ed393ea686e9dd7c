/**
 * @file sdl3_backend_factory.cc
 * @brief SDL3 backend factory implementation
 * @ingroup sdl3_backend
 */

#include <gavel_backends/sdl3/sdl3_backend.hh>
#include "sdl3_backend_impl.hh"

namespace gavel {

/**
 * @brief Create an uninitialized SDL3 backend
 *
 * audio_engine initializes the backend when it is handed one that is not.
 */
std::shared_ptr<audio_backend> create_sdl3_backend() {
    return std::make_shared<sdl3_backend>();
}

} // namespace gavel

/**
 * @file sdl3_backend_impl.hh
 * @brief SDL3 backend implementation
 * @ingroup sdl3_backend
 */

#ifndef GAVEL_SDL3_BACKEND_IMPL_HH
#define GAVEL_SDL3_BACKEND_IMPL_HH

#include <gavel/sdk/audio_backend.hh>
#include "sdl3.hh"
#include <map>
#include <mutex>
#include <string>

namespace gavel {

/**
 * @class sdl3_backend
 * @brief SDL3 implementation of the audio backend interface
 * @ingroup sdl3_backend
 *
 * Maps gavel device handles to SDL logical device ids. Every stream created
 * on a device converts from the requested format to the device format.
 *
 * @note Internal class. Create instances via create_sdl3_backend().
 */
class sdl3_backend : public audio_backend {
private:
    bool m_initialized = false;

    struct device_state {
        SDL_AudioDeviceID sdl_id = 0;
        audio_spec spec{};
    };

    std::map<uint32_t, device_state> m_devices;
    std::mutex m_devices_mutex;
    uint32_t m_next_handle = 1;

    static audio_format from_sdl_format(SDL_AudioFormat sdl_fmt);
    static SDL_AudioFormat to_sdl_format(audio_format fmt);

public:
    sdl3_backend() = default;
    ~sdl3_backend() override;

    void init() override;
    void shutdown() override;
    std::string get_name() const override;
    bool is_initialized() const override;

    uint32_t open_device(const std::string& device_id,
                         const audio_spec& spec,
                         audio_spec& obtained_spec) override;
    void close_device(uint32_t device_handle) override;

    std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        void (*callback)(void* userdata, uint8_t* stream, int len),
        void* userdata) override;

    SDL_AudioDeviceID get_sdl_device(uint32_t handle);
};

} // namespace gavel

#endif // GAVEL_SDL3_BACKEND_IMPL_HH

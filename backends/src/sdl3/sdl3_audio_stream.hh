#ifndef GAVEL_SDL3_AUDIO_STREAM_HH
#define GAVEL_SDL3_AUDIO_STREAM_HH

#include <gavel/sdk/audio_stream_interface.hh>
#include <gavel/sdk/audio_format.hh>
#include <gavel/sdk/buffer.hh>
#include "sdl3.hh"
#include <memory>

namespace gavel {

class sdl3_audio_stream : public audio_stream_interface {
public:
    sdl3_audio_stream(SDL_AudioDeviceID device_id, const audio_spec& spec,
                      void (*callback)(void* userdata, uint8_t* stream, int len),
                      void* userdata);
    ~sdl3_audio_stream() override;

    bool pause() override;
    bool resume() override;
    bool is_paused() const override;

private:
    static void sdl_callback(void* userdata, SDL_AudioStream* stream, int additional_amount, int total_amount);
    static SDL_AudioFormat to_sdl_format(audio_format fmt);

    SDL_AudioDeviceID m_device_id;
    std::shared_ptr<SDL_AudioStream> m_stream;
    void (*m_callback)(void* userdata, uint8_t* stream, int len);
    void* m_userdata;
    // only touched on the SDL audio thread
    buffer<uint8_t> m_scratch{0};
};

} // namespace gavel

#endif // GAVEL_SDL3_AUDIO_STREAM_HH

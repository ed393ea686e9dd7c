// This is copyrighted software. More information is at the end of this file.
#include "sdl3_audio_stream.hh"
#include <failsafe/failsafe.hh>

namespace gavel {

// SDL_Quit() destroys every stream itself
static void safe_destroy_audio_stream(SDL_AudioStream* stream) {
    if (stream && SDL_WasInit(SDL_INIT_AUDIO)) {
        SDL_DestroyAudioStream(stream);
    }
}

SDL_AudioFormat sdl3_audio_stream::to_sdl_format(audio_format fmt) {
    switch (fmt) {
        case audio_format::s16le:  return SDL_AUDIO_S16LE;
        case audio_format::f32le:  return SDL_AUDIO_F32LE;
        default:                   return SDL_AUDIO_UNKNOWN;
    }
}

sdl3_audio_stream::sdl3_audio_stream(SDL_AudioDeviceID device_id, const audio_spec& spec,
                                     void (*callback)(void* userdata, uint8_t* stream, int len),
                                     void* userdata)
    : m_device_id(device_id)
    , m_callback(callback)
    , m_userdata(userdata) {

    if (!m_callback) {
        THROW_RUNTIME("SDL3 stream requires a render callback");
    }

    SDL_AudioSpec sdl_spec;
    sdl_spec.format = to_sdl_format(spec.format);
    sdl_spec.channels = spec.channels;
    sdl_spec.freq = static_cast<int>(spec.freq);
    if (sdl_spec.format == SDL_AUDIO_UNKNOWN) {
        THROW_RUNTIME("Unsupported output format: ", spec.format);
    }

    SDL_AudioSpec device_spec;
    if (!SDL_GetAudioDeviceFormat(m_device_id, &device_spec, nullptr)) {
        THROW_RUNTIME("Failed to get device format: ", SDL_GetError());
    }

    // converts from the context format to the device format
    m_stream = std::shared_ptr<SDL_AudioStream>(
        SDL_CreateAudioStream(&sdl_spec, &device_spec),
        safe_destroy_audio_stream
    );
    if (!m_stream) {
        THROW_RUNTIME("Failed to create audio stream: ", SDL_GetError());
    }

    if (!SDL_SetAudioStreamGetCallback(m_stream.get(), sdl_callback, this)) {
        THROW_RUNTIME("Failed to set stream callback: ", SDL_GetError());
    }

    if (!SDL_BindAudioStream(m_device_id, m_stream.get())) {
        THROW_RUNTIME("Failed to bind stream to device: ", SDL_GetError());
    }

    // a new context is suspended until resume()
    if (!SDL_PauseAudioStreamDevice(m_stream.get())) {
        LOG_WARN("sdl3_stream", "Failed to pause new stream:", SDL_GetError());
    }
}

sdl3_audio_stream::~sdl3_audio_stream() {
    if (m_stream && SDL_WasInit(SDL_INIT_AUDIO)) {
        SDL_UnbindAudioStream(m_stream.get());
    }
}

void sdl3_audio_stream::sdl_callback(void* userdata,
                                     SDL_AudioStream* stream,
                                     int additional_amount, [[maybe_unused]] int total_amount) {
    auto* self = static_cast<sdl3_audio_stream*>(userdata);
    if (!self || additional_amount <= 0) {
        return;
    }

    self->m_scratch.grow(static_cast<size_t>(additional_amount));
    auto* data = self->m_scratch.data();
    self->m_callback(self->m_userdata, data, additional_amount);
    SDL_PutAudioStreamData(stream, data, additional_amount);
}

bool sdl3_audio_stream::pause() {
    return SDL_PauseAudioStreamDevice(m_stream.get());
}

bool sdl3_audio_stream::resume() {
    return SDL_ResumeAudioStreamDevice(m_stream.get());
}

bool sdl3_audio_stream::is_paused() const {
    return SDL_AudioStreamDevicePaused(m_stream.get());
}

} // namespace gavel

/*
 * Copyright (C) 2025
 *
 * This file is part of gavel.
 *
 * gavel is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * gavel is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with gavel.  If not, see <http://www.gnu.org/licenses/>.
 */

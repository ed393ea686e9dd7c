// This is copyrighted software. More information is at the end of this file.
#include "sdl3_backend_impl.hh"
#include "sdl3_audio_stream.hh"
#include <gavel/error.hh>
#include <failsafe/failsafe.hh>
#include <cstdlib>

namespace gavel {
    namespace {
        std::string get_sdl_error() {
            const char* error = SDL_GetError();
            return error ? error : "Unknown SDL error";
        }

#if defined(__clang__)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
        // "default" or a numeric SDL device id
        SDL_AudioDeviceID to_sdl_device_id(const std::string& device_id) {
            if (device_id.empty() || device_id == "default") {
                return SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK;
            }
            char* end = nullptr;
            const unsigned long id = std::strtoul(device_id.c_str(), &end, 10);
            if (end == device_id.c_str() || *end != '\0') {
                LOG_WARN("sdl3_backend", "Unknown device id", device_id, "- using the default device");
                return SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK;
            }
            return static_cast <SDL_AudioDeviceID>(id);
        }
#if defined(__clang__)
# pragma clang diagnostic pop
#elif defined(__GNUC__)
# pragma GCC diagnostic pop
#endif
    }

    audio_format sdl3_backend::from_sdl_format(SDL_AudioFormat sdl_fmt) {
        switch (sdl_fmt) {
            case SDL_AUDIO_S16LE: return audio_format::s16le;
            case SDL_AUDIO_F32LE: return audio_format::f32le;
            default: return audio_format::unknown;
        }
    }

    SDL_AudioFormat sdl3_backend::to_sdl_format(audio_format fmt) {
        switch (fmt) {
            case audio_format::s16le: return SDL_AUDIO_S16LE;
            case audio_format::f32le: return SDL_AUDIO_F32LE;
            default: return SDL_AUDIO_F32LE;
        }
    }

    sdl3_backend::~sdl3_backend() {
        if (m_initialized) {
            shutdown();
        }
    }

    void sdl3_backend::init() {
        if (m_initialized) {
            THROW_RUNTIME("SDL3 backend already initialized");
        }

        if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
            throw device_error("Failed to initialize SDL3 audio: " + get_sdl_error());
        }

        LOG_INFO("sdl3_backend", "Audio driver:", SDL_GetCurrentAudioDriver());
        m_initialized = true;
    }

    void sdl3_backend::shutdown() {
        if (!m_initialized) {
            return;
        }

        {
            std::lock_guard <std::mutex> lock(m_devices_mutex);
            for (const auto& [handle, info] : m_devices) {
                SDL_CloseAudioDevice(info.sdl_id);
            }
            m_devices.clear();
        }

        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_initialized = false;
    }

    std::string sdl3_backend::get_name() const {
        return "SDL3";
    }

    bool sdl3_backend::is_initialized() const {
        return m_initialized;
    }

    uint32_t sdl3_backend::open_device(const std::string& device_id,
                                       const audio_spec& spec,
                                       audio_spec& obtained_spec) {
        if (!m_initialized) {
            THROW_RUNTIME("Backend not initialized");
        }

        SDL_AudioSpec wanted;
        SDL_zero(wanted);
        wanted.freq = static_cast <int>(spec.freq);
        wanted.format = to_sdl_format(spec.format);
        wanted.channels = spec.channels;

        SDL_AudioDeviceID sdl_id = SDL_OpenAudioDevice(to_sdl_device_id(device_id), &wanted);
        if (sdl_id == 0) {
            LOG_ERROR("sdl3_backend", "SDL_OpenAudioDevice failed:", get_sdl_error());
            throw device_error("Failed to open audio device: " + get_sdl_error());
        }

        // the stream converts to the device format, so the context keeps
        // rendering in the requested one
        obtained_spec = spec;
        if (from_sdl_format(wanted.format) == audio_format::unknown) {
            obtained_spec.format = audio_format::f32le;
        }

        uint32_t handle = 0; {
            std::lock_guard <std::mutex> lock(m_devices_mutex);
            handle = m_next_handle++;
            device_state& info = m_devices[handle];
            info.sdl_id = sdl_id;
            info.spec = obtained_spec;
        }

        return handle;
    }

    void sdl3_backend::close_device(uint32_t device_handle) {
        std::lock_guard <std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(device_handle);
        if (it != m_devices.end()) {
            SDL_CloseAudioDevice(it->second.sdl_id);
            m_devices.erase(it);
        }
    }

    std::unique_ptr <audio_stream_interface> sdl3_backend::create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        void (*callback)(void* userdata, uint8_t* stream, int len),
        void* userdata) {
        SDL_AudioDeviceID sdl_id = get_sdl_device(device_handle);
        if (sdl_id == 0) {
            THROW_RUNTIME("Invalid device handle");
        }

        return std::make_unique <sdl3_audio_stream>(sdl_id, spec, callback, userdata);
    }

    SDL_AudioDeviceID sdl3_backend::get_sdl_device(uint32_t handle) {
        std::lock_guard <std::mutex> lock(m_devices_mutex);
        auto it = m_devices.find(handle);
        return it != m_devices.end() ? it->second.sdl_id : 0;
    }
}

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

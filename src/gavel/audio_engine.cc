// This is copyrighted software. More information is at the end of this file.
#include <gavel/audio_engine.hh>
#include <gavel/audio_context.hh>
#include <gavel/capability_probe.hh>
#include <gavel/channel_router.hh>
#include <gavel/event_loop.hh>
#include <gavel/fetcher.hh>
#include <gavel/software_decoder.hh>
#include <gavel/software_handle.hh>
#include <gavel/error.hh>
#include <failsafe/failsafe.hh>

namespace gavel {
    struct audio_engine::impl {
        impl(event_loop& l, engine_config c)
            : loop(l),
              cfg(std::move(c)) {
        }

        ~impl() {
            // the device must be closed before the backend shuts down
            router.reset();
            decoder.reset();
            context.reset();
            if (owns_backend_init && backend) {
                backend->shutdown();
            }
        }

        event_loop& loop;
        engine_config cfg;
        std::shared_ptr <audio_backend> backend;
        bool owns_backend_init = false;
        std::shared_ptr <fetcher> transport;
        std::unique_ptr <capability_probe> probe;
        std::unique_ptr <audio_context> context;
        std::unique_ptr <software_decoder> decoder;
        std::unique_ptr <channel_router> router;
        bool interaction_seen = false;
    };

    audio_engine::audio_engine(event_loop& loop,
                               std::shared_ptr <audio_backend> backend,
                               engine_config cfg,
                               std::shared_ptr <fetcher> transport,
                               std::shared_ptr <const media_capabilities> host)
        : m_pimpl(std::make_unique <impl>(loop, std::move(cfg))) {
        if (!backend) {
            throw device_error("Backend is null");
        }
        if (!backend->is_initialized()) {
            backend->init();
            m_pimpl->owns_backend_init = true;
        }
        m_pimpl->backend = backend;

        if (!transport) {
            transport = std::make_shared <file_fetcher>(loop, m_pimpl->cfg.asset_root);
        }
        m_pimpl->transport = std::move(transport);

        if (!host) {
            host = std::make_shared <static_media_capabilities>(m_pimpl->cfg.native_mime_types);
        }
        m_pimpl->probe = std::make_unique <capability_probe>(std::move(host));

        m_pimpl->context = std::make_unique <audio_context>(loop, backend, m_pimpl->cfg.output,
                                                            m_pimpl->cfg.device_id);
        m_pimpl->decoder = std::make_unique <software_decoder>(loop, *m_pimpl->transport);

        impl* p = m_pimpl.get();
        m_pimpl->router = std::make_unique <channel_router>(*m_pimpl->probe, [p]() {
            return std::shared_ptr <playback_handle>(
                std::make_shared <software_handle>(*p->context, *p->decoder, p->cfg.load_poll_interval));
        });
    }

    audio_engine::~audio_engine() = default;

    const engine_config& audio_engine::config() const noexcept {
        return m_pimpl->cfg;
    }

    event_loop& audio_engine::loop() const noexcept {
        return m_pimpl->loop;
    }

    audio_context& audio_engine::context() const noexcept {
        return *m_pimpl->context;
    }

    software_decoder& audio_engine::decoder() const noexcept {
        return *m_pimpl->decoder;
    }

    capability_probe& audio_engine::probe() const noexcept {
        return *m_pimpl->probe;
    }

    channel_router& audio_engine::router() const noexcept {
        return *m_pimpl->router;
    }

    std::shared_ptr <software_handle> audio_engine::create_software_handle() const {
        return std::make_shared <software_handle>(*m_pimpl->context, *m_pimpl->decoder,
                                                  m_pimpl->cfg.load_poll_interval);
    }

    courtroom_channels audio_engine::create_courtroom(host_channels host,
                                                      const std::string& asset_host,
                                                      courtroom_channels::error_hook_t on_error) {
        return courtroom_channels(*m_pimpl->router, std::move(host), asset_host,
                                  m_pimpl->cfg.music_volume, m_pimpl->cfg.blip_volume, std::move(on_error));
    }

    remote_offset_sync audio_engine::create_synchronizer(courtroom_channels& channels) const {
        return remote_offset_sync(m_pimpl->loop,
                                  [&channels](int index) { return channels.music_channel(index); },
                                  m_pimpl->cfg.readiness_delay);
    }

    void audio_engine::init_software_decoding(std::function <void(bool)> done) {
        if (!m_pimpl->probe->needs_software_decoding()) {
            if (done) {
                m_pimpl->loop.post([done]() { done(false); });
            }
            return;
        }

        m_pimpl->decoder->prepare([done](std::exception_ptr error) {
            if (error) {
                LOG_ERROR("audio_engine", "Failed to initialize Opus decoder:", describe_error(error));
            } else {
                LOG_INFO("audio_engine", "Opus decoder initialized");
            }
            if (done) {
                done(!error);
            }
        });
    }

    void audio_engine::notify_user_interaction() {
        if (m_pimpl->interaction_seen) {
            return;
        }
        m_pimpl->interaction_seen = true;
        m_pimpl->context->resume();
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

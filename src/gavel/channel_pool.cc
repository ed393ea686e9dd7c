// This is copyrighted software. More information is at the end of this file.
#include <gavel/channel_pool.hh>
#include <gavel/channel_router.hh>
#include <failsafe/failsafe.hh>

namespace gavel {
    channel_pool::channel_pool(std::vector <std::shared_ptr <playback_handle>> handles)
        : m_handles(std::move(handles)) {
    }

    size_t channel_pool::size() const noexcept {
        return m_handles.size();
    }

    bool channel_pool::empty() const noexcept {
        return m_handles.empty();
    }

    std::shared_ptr <playback_handle> channel_pool::at(int index) const {
        if (index < 0 || static_cast <size_t>(index) >= m_handles.size()) {
            return nullptr;
        }
        return m_handles[static_cast <size_t>(index)];
    }

    std::shared_ptr <playback_handle> channel_pool::next() {
        if (m_handles.empty()) {
            return nullptr;
        }
        const size_t n = m_handles.size();
        size_t chosen = m_cursor % n;
        for (size_t i = 0; i < n; i++) {
            const size_t idx = (m_cursor + i) % n;
            if (m_handles[idx]->paused()) {
                chosen = idx;
                break;
            }
        }
        m_cursor = (chosen + 1) % n;
        return m_handles[chosen];
    }

    void channel_pool::set_volume(float v) {
        for (auto& h : m_handles) {
            h->set_volume(v);
        }
    }

    const std::vector <std::shared_ptr <playback_handle>>& channel_pool::handles() const noexcept {
        return m_handles;
    }

    courtroom_channels::courtroom_channels(channel_router& router,
                                           host_channels host,
                                           const std::string& asset_host,
                                           float music_volume,
                                           float blip_volume,
                                           error_hook_t on_error)
        : m_on_error(std::move(on_error)) {
        m_music = channel_pool(build(router, std::move(host.music), "music", music_volume));
        m_blips = channel_pool(build(router, std::move(host.blips), "blip", blip_volume));
        m_sfx = build_single(router, std::move(host.sfx), asset_host + default_sfx);
        m_shout = build_single(router, std::move(host.shout), asset_host + default_shout);
        m_testimony = build_single(router, std::move(host.testimony), asset_host + default_testimony);

        LOG_INFO("courtroom_channels", "Created", m_music.size(), "music and", m_blips.size(), "blip channels");
    }

    std::vector <std::shared_ptr <playback_handle>> courtroom_channels::build(
        channel_router& router,
        std::vector <std::shared_ptr <playback_handle>> host,
        const char* name,
        float volume) {
        std::vector <std::shared_ptr <playback_handle>> out;
        out.reserve(host.size());
        for (auto& element : host) {
            if (!element) {
                continue;
            }
            element->set_volume(clamp_volume(volume));
            auto handle = router.wrap(std::move(element));
            if (m_on_error) {
                std::weak_ptr <playback_handle> weak = handle;
                auto hook = m_on_error;
                std::string channel = name;
                handle->add_listener(playback_event::error, [weak, hook, channel](playback_event) {
                    if (auto h = weak.lock()) {
                        hook(channel, *h);
                    }
                });
            }
            out.push_back(std::move(handle));
        }
        return out;
    }

    std::shared_ptr <playback_handle> courtroom_channels::build_single(channel_router& router,
                                                                       std::shared_ptr <playback_handle> host,
                                                                       const std::string& source) {
        if (!host) {
            return nullptr;
        }
        auto handle = router.wrap(std::move(host));
        // assigned after wrapping so a software companion loads it as well
        handle->set_source(source);
        return handle;
    }

    channel_pool& courtroom_channels::music() noexcept {
        return m_music;
    }

    channel_pool& courtroom_channels::blips() noexcept {
        return m_blips;
    }

    std::shared_ptr <playback_handle> courtroom_channels::music_channel(int index) const {
        return m_music.at(index);
    }

    const std::shared_ptr <playback_handle>& courtroom_channels::sfx() const noexcept {
        return m_sfx;
    }

    const std::shared_ptr <playback_handle>& courtroom_channels::shout() const noexcept {
        return m_shout;
    }

    const std::shared_ptr <playback_handle>& courtroom_channels::testimony() const noexcept {
        return m_testimony;
    }

    void courtroom_channels::set_music_volume(float v) {
        m_music.set_volume(clamp_volume(v));
    }

    void courtroom_channels::set_blip_volume(float v) {
        m_blips.set_volume(clamp_volume(v));
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

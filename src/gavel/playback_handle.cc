// This is copyrighted software. More information is at the end of this file.
#include <gavel/playback_handle.hh>

#include <algorithm>
#include <cmath>
#include <ostream>

namespace gavel {
    namespace {
        constexpr const char* software_extension = ".opus";
    }

    const char* to_string(playback_event ev) {
        switch (ev) {
            case playback_event::error: return "error";
            case playback_event::ended: return "ended";
            case playback_event::loaded: return "loaded";
            case playback_event::loaded_metadata: return "loadedmetadata";
            case playback_event::play: return "play";
            case playback_event::pause: return "pause";
        }
        return "unknown";
    }

    std::ostream& operator<<(std::ostream& os, playback_event ev) {
        return os << to_string(ev);
    }

    bool is_software_source(const std::string& uri) {
        const std::string ext(software_extension);
        return uri.size() >= ext.size() && uri.compare(uri.size() - ext.size(), ext.size(), ext) == 0;
    }

    float clamp_volume(float v) noexcept {
        if (std::isnan(v)) {
            return 0.0f;
        }
        return std::clamp(v, 0.0f, 1.0f);
    }

    playback_handle::~playback_handle() = default;

    handle_kind playback_handle::active_kind() const {
        return kind();
    }

    playback_handle::listener_id playback_handle::add_listener(playback_event ev, listener_t fn) {
        const auto id = m_next_id++;
        m_listeners.push_back({id, ev, std::move(fn)});
        return id;
    }

    void playback_handle::remove_listener(listener_id id) {
        m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(),
                                         [id](const listener& l) { return l.id == id; }),
                          m_listeners.end());
    }

    size_t playback_handle::listener_count() const noexcept {
        return m_listeners.size();
    }

    void playback_handle::emit(playback_event ev) {
        // listeners may add or remove listeners while we iterate
        std::vector <listener_id> ids;
        for (const auto& l : m_listeners) {
            if (l.event == ev) {
                ids.push_back(l.id);
            }
        }
        for (auto id : ids) {
            auto it = std::find_if(m_listeners.begin(), m_listeners.end(),
                                   [id](const listener& l) { return l.id == id; });
            if (it == m_listeners.end()) {
                continue;
            }
            auto fn = it->fn;
            fn(ev);
        }
    }

    handle_kind native_handle::kind() const {
        return handle_kind::native;
    }

    void native_handle::notify(playback_event ev) {
        emit(ev);
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

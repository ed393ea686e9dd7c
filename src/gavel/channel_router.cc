// This is copyrighted software. More information is at the end of this file.
#include <gavel/channel_router.hh>
#include <gavel/capability_probe.hh>

#include <array>
#include <stdexcept>

namespace gavel {
    namespace {
        constexpr std::array <playback_event, 6> all_events = {
            playback_event::error,
            playback_event::ended,
            playback_event::loaded,
            playback_event::loaded_metadata,
            playback_event::play,
            playback_event::pause
        };
    }

    routed_handle::routed_handle(std::shared_ptr <playback_handle> native,
                                 std::shared_ptr <playback_handle> software)
        : m_native(std::move(native)),
          m_software(std::move(software)) {
        if (!m_native || !m_software) {
            throw std::invalid_argument("routed_handle needs both a native and a software handle");
        }
        subscribe(*m_native, m_native_listeners);
        subscribe(*m_software, m_software_listeners);
    }

    routed_handle::~routed_handle() {
        for (auto id : m_native_listeners) {
            m_native->remove_listener(id);
        }
        for (auto id : m_software_listeners) {
            m_software->remove_listener(id);
        }
    }

    void routed_handle::subscribe(playback_handle& inner, std::vector <listener_id>& ids) {
        for (auto ev : all_events) {
            ids.push_back(inner.add_listener(ev, [this, &inner](playback_event e) {
                if (&inner == &active()) {
                    emit(e);
                }
            }));
        }
    }

    handle_kind routed_handle::kind() const {
        return handle_kind::routed;
    }

    handle_kind routed_handle::active_kind() const {
        return active().kind();
    }

    playback_handle& routed_handle::active() const {
        auto src = m_native->source();
        if (src.empty()) {
            src = m_software->source();
        }
        return is_software_source(src) ? *m_software : *m_native;
    }

    const std::shared_ptr <playback_handle>& routed_handle::native() const noexcept {
        return m_native;
    }

    const std::shared_ptr <playback_handle>& routed_handle::software() const noexcept {
        return m_software;
    }

    std::string routed_handle::source() const {
        return active().source();
    }

    void routed_handle::set_source(const std::string& uri) {
        m_software->set_source(uri);
        m_native->set_source(uri);
    }

    float routed_handle::volume() const {
        return active().volume();
    }

    void routed_handle::set_volume(float v) {
        m_software->set_volume(v);
        m_native->set_volume(v);
    }

    bool routed_handle::loop() const {
        return active().loop();
    }

    void routed_handle::set_loop(bool loop) {
        m_software->set_loop(loop);
        m_native->set_loop(loop);
    }

    bool routed_handle::paused() const {
        return active().paused();
    }

    double routed_handle::current_time() const {
        return active().current_time();
    }

    void routed_handle::set_current_time(double seconds) {
        m_software->set_current_time(seconds);
        m_native->set_current_time(seconds);
    }

    double routed_handle::duration() const {
        return active().duration();
    }

    void routed_handle::play() {
        active().play();
    }

    void routed_handle::pause() {
        active().pause();
    }

    void routed_handle::load() {
        active().load();
    }

    std::exception_ptr routed_handle::error() const {
        return active().error();
    }

    channel_router::channel_router(capability_probe& probe, software_factory_t make_software)
        : m_probe(probe),
          m_make_software(std::move(make_software)) {
    }

    std::shared_ptr <playback_handle> channel_router::wrap(std::shared_ptr <playback_handle> native) {
        if (!native) {
            throw std::invalid_argument("channel_router::wrap: native handle is null");
        }
        if (!m_probe.needs_software_decoding()) {
            return native;
        }

        auto software = m_make_software();
        software->set_volume(native->volume());
        software->set_loop(native->loop());
        return std::make_shared <routed_handle>(std::move(native), std::move(software));
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

// This is copyrighted software. More information is at the end of this file.
#include <gavel/remote_offset_sync.hh>
#include <gavel/event_loop.hh>
#include <gavel/playback_handle.hh>
#include <failsafe/failsafe.hh>

#include <cmath>
#include <cstdlib>

namespace gavel {
    namespace {
        std::string trim(const std::string& s) {
            const auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) {
                return {};
            }
            const auto last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }

        double parse_number(const std::vector <std::string>& fields, size_t idx) {
            if (idx >= fields.size()) {
                return 0.0;
            }
            const auto text = trim(fields[idx]);
            if (text.empty()) {
                return 0.0;
            }
            char* end = nullptr;
            const double v = std::strtod(text.c_str(), &end);
            if (end != text.c_str() + text.size() || !std::isfinite(v)) {
                return 0.0;
            }
            return v;
        }

        void seek_and_play(playback_handle& handle, double target, double load_start, const event_loop& loop) {
            const double drift = loop.now_seconds() - load_start;
            handle.set_current_time(target + drift);
            handle.play();
        }
    }

    remote_offset_command parse_remote_offset_command(const std::vector <std::string>& fields) {
        remote_offset_command cmd;
        cmd.offset_seconds = parse_number(fields, 1);

        const double channel = parse_number(fields, 2);
        if (std::trunc(channel) != channel || std::fabs(channel) > 1e9) {
            // no channel has a fractional index
            cmd.channel = -1;
        } else {
            cmd.channel = static_cast <int>(channel);
        }
        return cmd;
    }

    remote_offset_sync::remote_offset_sync(event_loop& loop,
                                           channel_lookup_t lookup,
                                           std::chrono::milliseconds readiness_delay)
        : m_loop(loop),
          m_lookup(std::move(lookup)),
          m_readiness_delay(readiness_delay) {
    }

    void remote_offset_sync::apply_remote_offset(int channel, double target_offset_seconds) {
        std::shared_ptr <playback_handle> handle;
        if (m_lookup) {
            handle = m_lookup(channel);
        }
        if (!handle) {
            return;
        }

        const double load_start = m_loop.now_seconds();
        handle->pause();
        std::weak_ptr <playback_handle> weak = handle;
        event_loop* loop = &m_loop;

        if (handle->active_kind() == handle_kind::native) {
            auto id = std::make_shared <playback_handle::listener_id>(0);
            *id = handle->add_listener(playback_event::loaded_metadata,
                                       [weak, id, target_offset_seconds, load_start, loop](playback_event) {
                                           auto h = weak.lock();
                                           if (!h) {
                                               return;
                                           }
                                           h->remove_listener(*id);
                                           seek_and_play(*h, target_offset_seconds, load_start, *loop);
                                       });
            return;
        }

        LOG_DEBUG("remote_offset_sync", "Channel", channel, "waits", m_readiness_delay.count(), "ms before seeking");
        m_loop.post_delayed(m_readiness_delay, [weak, target_offset_seconds, load_start, loop]() {
            if (auto h = weak.lock()) {
                seek_and_play(*h, target_offset_seconds, load_start, *loop);
            }
        });
    }

    void remote_offset_sync::apply(const remote_offset_command& cmd) {
        apply_remote_offset(cmd.channel, cmd.offset_seconds);
    }

    std::chrono::milliseconds remote_offset_sync::readiness_delay() const noexcept {
        return m_readiness_delay;
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

// This is copyrighted software. More information is at the end of this file.
#include <gavel/software_handle.hh>
#include <gavel/audio_context.hh>
#include <gavel/event_loop.hh>
#include <gavel/software_decoder.hh>
#include <gavel/error.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>

namespace gavel {
    software_handle::software_handle(audio_context& ctx,
                                     software_decoder& decoder,
                                     std::chrono::milliseconds poll_interval)
        : m_ctx(ctx),
          m_decoder(decoder),
          m_poll_interval(poll_interval),
          m_gain(ctx.create_gain(1.0f)),
          m_self(std::make_shared <software_handle*>(this)) {
    }

    software_handle::~software_handle() {
        stop_node();
    }

    handle_kind software_handle::kind() const {
        return handle_kind::software;
    }

    std::string software_handle::source() const {
        return m_source;
    }

    void software_handle::set_source(const std::string& uri) {
        stop_node();
        m_paused = true;
        m_play_token++;

        m_source = uri;
        m_error = nullptr;
        m_buffer.reset();
        m_duration = 0.0;
        m_current_time = 0.0;

        if (is_software_source(uri)) {
            load_audio(uri);
        } else {
            // drop the result of any load still in flight
            m_load_generation++;
            m_state = load_state::empty;
        }
    }

    float software_handle::volume() const {
        return m_volume;
    }

    void software_handle::set_volume(float v) {
        m_volume = clamp_volume(v);
        m_gain->set_gain(m_volume);
    }

    bool software_handle::loop() const {
        return m_loop;
    }

    void software_handle::set_loop(bool loop) {
        m_loop = loop;
        if (m_node) {
            m_node->set_loop(loop);
        }
    }

    bool software_handle::paused() const {
        return m_paused;
    }

    double software_handle::current_time() const {
        if (!m_paused && m_node) {
            return m_ctx.current_time() - m_start_time;
        }
        return m_current_time;
    }

    void software_handle::set_current_time(double seconds) {
        m_current_time = std::max(0.0, seconds);
        if (!m_paused && m_buffer) {
            stop_node();
            start_from(m_current_time);
        }
    }

    double software_handle::duration() const {
        return m_duration;
    }

    void software_handle::play() {
        const auto token = ++m_play_token;
        std::weak_ptr <software_handle*> alive = m_self;
        m_ctx.resume([alive, token]() {
            if (auto self = alive.lock()) {
                (*self)->await_load(token);
            }
        });
    }

    void software_handle::pause() {
        // a play() still waiting for its load is cancelled too
        m_play_token++;
        if (!m_node || m_paused) {
            return;
        }
        m_current_time = current_time();
        stop_node();
        m_paused = true;
        emit(playback_event::pause);
    }

    void software_handle::load() {
        if (m_source.empty() || m_state == load_state::loading) {
            return;
        }
        load_audio(m_source);
    }

    std::exception_ptr software_handle::error() const {
        return m_error;
    }

    software_handle::load_state software_handle::state() const noexcept {
        return m_state;
    }

    void software_handle::load_audio(const std::string& uri) {
        m_state = load_state::loading;
        const auto generation = ++m_load_generation;
        std::weak_ptr <software_handle*> alive = m_self;
        m_decoder.decode(uri, [alive, generation, uri](pcm_buffer_ptr buffer, std::exception_ptr error) {
            auto self = alive.lock();
            if (!self) {
                return;
            }
            software_handle* me = *self;
            if (generation != me->m_load_generation) {
                LOG_DEBUG("software_handle", "Dropping superseded load of", uri);
                return;
            }
            me->on_loaded(uri, std::move(buffer), std::move(error));
        });
    }

    void software_handle::on_loaded(const std::string& uri, pcm_buffer_ptr buffer, std::exception_ptr error) {
        if (error) {
            m_state = load_state::errored;
            m_error = error;
            LOG_WARN("software_handle", "Failed to load", uri, ":", describe_error(error));
            emit(playback_event::error);
            return;
        }
        m_buffer = std::move(buffer);
        m_duration = m_buffer->duration();
        m_state = load_state::ready;
        emit(playback_event::loaded);
    }

    void software_handle::await_load(uint64_t play_token) {
        if (play_token != m_play_token) {
            return;
        }
        if (m_state == load_state::loading) {
            std::weak_ptr <software_handle*> alive = m_self;
            m_ctx.loop().post_delayed(m_poll_interval, [alive, play_token]() {
                if (auto self = alive.lock()) {
                    (*self)->await_load(play_token);
                }
            });
            return;
        }
        finish_play();
    }

    void software_handle::finish_play() {
        if (!m_buffer) {
            const missing_buffer_error missing("No decoded audio for '" + m_source + "'");
            LOG_WARN("software_handle", missing.what());
            if (!m_error) {
                m_error = std::make_exception_ptr(missing);
            }
            emit(playback_event::error);
            return;
        }

        stop_node();
        start_from(m_current_time);
        emit(playback_event::play);
    }

    void software_handle::start_from(double offset) {
        auto node = m_ctx.create_buffer_source(m_buffer, m_gain);
        node->set_loop(m_loop);

        std::weak_ptr <software_handle*> alive = m_self;
        std::weak_ptr <buffer_source_node> weak_node = node;
        node->set_on_ended([alive, weak_node]() {
            auto self = alive.lock();
            auto n = weak_node.lock();
            if (self && n) {
                (*self)->on_node_ended(n);
            }
        });

        m_start_time = m_ctx.current_time() - offset;
        m_node = node;
        m_paused = false;
        node->start(offset);
    }

    void software_handle::stop_node() {
        if (m_node) {
            m_node->stop();
            m_node.reset();
        }
    }

    void software_handle::on_node_ended(const std::shared_ptr <buffer_source_node>& node) {
        if (node != m_node) {
            return;
        }
        m_node.reset();
        if (m_loop) {
            // loop was switched on after the node had already finished
            start_from(0.0);
            return;
        }
        m_paused = true;
        m_current_time = 0.0;
        emit(playback_event::ended);
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

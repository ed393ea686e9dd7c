// This is copyrighted software. More information is at the end of this file.
#include <gavel/audio_context.hh>
#include <gavel/event_loop.hh>
#include <gavel/error.hh>
#include <gavel/sdk/buffer.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace gavel {
    struct buffer_source_node::graph {
        graph(event_loop& l, std::shared_ptr <audio_backend> b)
            : loop(l),
              backend(std::move(b)) {
        }

        event_loop& loop;
        std::shared_ptr <audio_backend> backend;
        uint32_t device = 0;
        std::unique_ptr <audio_stream_interface> stream;
        audio_spec spec{audio_format::f32le, 2, 48000};
        std::atomic <audio_context::state> current{audio_context::state::suspended};
        std::atomic <uint64_t> frames_rendered{0};

        mutable std::mutex mutex;
        std::vector <std::shared_ptr <buffer_source_node>> sources;
        std::vector <std::shared_ptr <buffer_source_node>> finished;
        gavel::buffer <float> mix{0};

        void render(uint8_t* out, int len);
        bool mix_source(buffer_source_node& node, size_t frames);
        void write_output(uint8_t* out, size_t samples, size_t len) const;
    };

    namespace {
        float sample_at(const pcm_buffer& buf, size_t out_channel, channels_t out_channels,
                        size_t idx, size_t next, float frac) {
            const auto src_channels = buf.channels();
            auto lerp = [&](channels_t ch) {
                const float* data = buf.channel_data(ch);
                return data[idx] + (data[next] - data[idx]) * frac;
            };

            if (out_channels == 1 && src_channels > 1) {
                float acc = 0.0f;
                for (channels_t ch = 0; ch < src_channels; ch++) {
                    acc += lerp(ch);
                }
                return acc / static_cast <float>(src_channels);
            }
            if (src_channels == 1) {
                return lerp(0);
            }
            if (out_channel < src_channels) {
                return lerp(static_cast <channels_t>(out_channel));
            }
            return 0.0f;
        }
    }

    // gain_node

    gain_node::gain_node(float gain)
        : m_gain(gain) {
    }

    void gain_node::set_gain(float gain) noexcept {
        m_gain.store(gain, std::memory_order_relaxed);
    }

    float gain_node::gain() const noexcept {
        return m_gain.load(std::memory_order_relaxed);
    }

    // graph, runs on the audio thread

    bool buffer_source_node::graph::mix_source(buffer_source_node& node, size_t frames) {
        const auto& buf = *node.m_buffer;
        const auto total = static_cast <double>(buf.frames());
        if (buf.frames() == 0 || buf.channels() == 0) {
            return true;
        }

        const double step = static_cast <double>(buf.sample_rate()) / static_cast <double>(spec.freq);
        const float gain = node.m_gain ? node.m_gain->gain() : 1.0f;
        const size_t out_channels = spec.channels;
        const size_t last = static_cast <size_t>(buf.frames() - 1);

        float* dst = mix.data();
        for (size_t i = 0; i < frames; i++) {
            if (node.m_position >= total) {
                if (!node.m_loop) {
                    return true;
                }
                node.m_position = std::fmod(node.m_position, total);
            }
            const auto idx = static_cast <size_t>(node.m_position);
            const auto frac = static_cast <float>(node.m_position - static_cast <double>(idx));
            size_t next = idx + 1;
            if (next > last) {
                next = node.m_loop ? 0 : last;
            }
            for (size_t c = 0; c < out_channels; c++) {
                *dst++ += gain * sample_at(buf, c, spec.channels, idx, next, frac);
            }
            node.m_position += step;
        }
        return node.m_position >= total && !node.m_loop;
    }

    void buffer_source_node::graph::write_output(uint8_t* out, size_t samples, size_t len) const {
        switch (spec.format) {
            case audio_format::f32le:
                std::memcpy(out, mix.data(), samples * sizeof(float));
                break;
            case audio_format::s16le: {
                auto* dst = reinterpret_cast <int16_t*>(out);
                for (size_t i = 0; i < samples; i++) {
                    const float v = std::clamp(mix[i], -1.0f, 1.0f);
                    dst[i] = static_cast <int16_t>(std::lrint(v * 32767.0f));
                }
                break;
            }
            default:
                std::memset(out, 0, len);
                return;
        }
        const size_t written = samples * audio_format_byte_size(spec.format);
        if (written < len) {
            std::memset(out + written, 0, len - written);
        }
    }

    void buffer_source_node::graph::render(uint8_t* out, int len) {
        if (len <= 0) {
            return;
        }
        const size_t bytes = static_cast <size_t>(len);
        const size_t frame_size = static_cast <size_t>(audio_format_byte_size(spec.format)) * spec.channels;
        if (frame_size == 0) {
            std::memset(out, 0, bytes);
            return;
        }
        const size_t frames = bytes / frame_size;
        const size_t samples = frames * spec.channels;

        std::lock_guard <std::mutex> lock(mutex);
        mix.grow(samples);
        std::fill_n(mix.data(), samples, 0.0f);

        finished.clear();
        for (auto& node : sources) {
            if (mix_source(*node, frames)) {
                finished.push_back(node);
            }
        }

        for (auto& node : finished) {
            node->m_active = false;
            sources.erase(std::remove(sources.begin(), sources.end(), node), sources.end());
            std::weak_ptr <buffer_source_node> weak = node;
            loop.post([weak]() {
                auto n = weak.lock();
                if (!n || !n->m_on_ended) {
                    return;
                }
                auto cb = n->m_on_ended;
                cb();
            });
        }
        finished.clear();

        write_output(out, samples, bytes);
        frames_rendered.fetch_add(frames, std::memory_order_relaxed);
    }

    // buffer_source_node

    buffer_source_node::buffer_source_node(std::weak_ptr <graph> owner,
                                           pcm_buffer_ptr buffer,
                                           std::shared_ptr <gain_node> gain)
        : m_graph(std::move(owner)),
          m_buffer(std::move(buffer)),
          m_gain(std::move(gain)) {
    }

    buffer_source_node::~buffer_source_node() = default;

    void buffer_source_node::start(double offset) {
        auto g = m_graph.lock();
        if (!g) {
            return;
        }
        std::lock_guard <std::mutex> lock(g->mutex);
        if (m_started || g->current.load() == audio_context::state::closed) {
            return;
        }
        m_started = true;
        m_active = true;
        m_position = std::max(0.0, offset) * static_cast <double>(m_buffer->sample_rate());
        g->sources.push_back(shared_from_this());
    }

    void buffer_source_node::stop() {
        auto g = m_graph.lock();
        if (!g) {
            m_active = false;
            return;
        }
        std::lock_guard <std::mutex> lock(g->mutex);
        if (!m_active) {
            return;
        }
        m_active = false;
        auto& v = g->sources;
        v.erase(std::remove_if(v.begin(), v.end(),
                               [this](const auto& p) { return p.get() == this; }),
                v.end());
    }

    void buffer_source_node::set_loop(bool loop) {
        auto g = m_graph.lock();
        if (!g) {
            m_loop = loop;
            return;
        }
        std::lock_guard <std::mutex> lock(g->mutex);
        m_loop = loop;
    }

    bool buffer_source_node::loop() const {
        auto g = m_graph.lock();
        if (!g) {
            return m_loop;
        }
        std::lock_guard <std::mutex> lock(g->mutex);
        return m_loop;
    }

    void buffer_source_node::set_on_ended(ended_callback_t cb) {
        m_on_ended = std::move(cb);
    }

    bool buffer_source_node::active() const {
        auto g = m_graph.lock();
        if (!g) {
            return false;
        }
        std::lock_guard <std::mutex> lock(g->mutex);
        return m_active;
    }

    const pcm_buffer_ptr& buffer_source_node::buffer() const noexcept {
        return m_buffer;
    }

    // audio_context

    audio_context::audio_context(event_loop& loop,
                                 std::shared_ptr <audio_backend> backend,
                                 const audio_spec& wanted,
                                 const std::string& device_id) {
        if (!backend) {
            throw device_error("Backend is null");
        }
        if (!backend->is_initialized()) {
            throw device_error("Backend is not initialized");
        }

        m_graph = std::make_shared <buffer_source_node::graph>(loop, backend);

        audio_spec obtained{};
        m_graph->device = backend->open_device(device_id, wanted, obtained);
        if (!m_graph->device) {
            throw device_error("Failed to open audio device: " + device_id);
        }
        if (obtained.freq == 0 || obtained.channels == 0 || obtained.format == audio_format::unknown) {
            obtained = wanted;
        }
        m_graph->spec = obtained;

        m_graph->stream = backend->create_stream(m_graph->device, obtained, &audio_context::render_callback,
                                                 m_graph.get());
        if (!m_graph->stream) {
            backend->close_device(m_graph->device);
            throw device_error("Failed to create output stream on " + device_id);
        }

        LOG_INFO("audio_context", "Opened", device_id, "on", backend->get_name(), ":",
                 obtained.freq, "Hz,", static_cast <int>(obtained.channels), "channels,", obtained.format);
    }

    audio_context::~audio_context() {
        close();
    }

    audio_context::state audio_context::get_state() const {
        return m_graph->current.load();
    }

    void audio_context::resume(std::function <void()> done) {
        const auto st = m_graph->current.load();
        if (st == state::closed) {
            LOG_WARN("audio_context", "resume() on a closed context");
        } else if (st == state::suspended) {
            if (m_graph->stream->resume()) {
                m_graph->current = state::running;
                LOG_DEBUG("audio_context", "Context running");
            } else {
                LOG_ERROR("audio_context", "Output stream refused to resume");
            }
        }
        if (done) {
            m_graph->loop.post(std::move(done));
        }
    }

    void audio_context::suspend() {
        if (m_graph->current.load() != state::running) {
            return;
        }
        m_graph->stream->pause();
        m_graph->current = state::suspended;
    }

    void audio_context::close() {
        if (!m_graph || m_graph->current.load() == state::closed) {
            return;
        }
        m_graph->current = state::closed;

        // no callback runs once the stream is gone
        if (m_graph->stream) {
            m_graph->stream->pause();
            m_graph->stream.reset();
        }
        {
            std::lock_guard <std::mutex> lock(m_graph->mutex);
            for (auto& node : m_graph->sources) {
                node->m_active = false;
            }
            m_graph->sources.clear();
        }
        if (m_graph->device) {
            m_graph->backend->close_device(m_graph->device);
            m_graph->device = 0;
        }
    }

    double audio_context::current_time() const {
        const auto frames = m_graph->frames_rendered.load(std::memory_order_relaxed);
        return static_cast <double>(frames) / static_cast <double>(m_graph->spec.freq);
    }

    audio_spec audio_context::get_spec() const {
        return m_graph->spec;
    }

    std::shared_ptr <gain_node> audio_context::create_gain(float gain) const {
        return std::make_shared <gain_node>(gain);
    }

    std::shared_ptr <buffer_source_node> audio_context::create_buffer_source(
        pcm_buffer_ptr buffer,
        std::shared_ptr <gain_node> gain) {
        if (!buffer) {
            throw std::invalid_argument("create_buffer_source: buffer is null");
        }
        return std::shared_ptr <buffer_source_node>(
            new buffer_source_node(m_graph, std::move(buffer), std::move(gain)));
    }

    size_t audio_context::active_sources() const {
        std::lock_guard <std::mutex> lock(m_graph->mutex);
        return m_graph->sources.size();
    }

    event_loop& audio_context::loop() const {
        return m_graph->loop;
    }

    void audio_context::render_callback(void* userdata, uint8_t* out, int len) {
        static_cast <buffer_source_node::graph*>(userdata)->render(out, len);
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

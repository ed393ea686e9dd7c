// This is copyrighted software. More information is at the end of this file.
#include <gavel/pcm_buffer.hh>

#include <limits>
#include <stdexcept>

namespace gavel {
    pcm_buffer::pcm_buffer(std::vector <std::vector <float>> channel_data, sample_rate_t sample_rate)
        : m_channels(std::move(channel_data)),
          m_sample_rate(sample_rate),
          m_frames(0) {
        if (m_sample_rate == 0) {
            throw std::invalid_argument("pcm_buffer: sample rate must not be zero");
        }
        if (m_channels.size() > std::numeric_limits <channels_t>::max()) {
            throw std::invalid_argument("pcm_buffer: too many channels");
        }
        if (!m_channels.empty()) {
            m_frames = m_channels.front().size();
            for (const auto& ch : m_channels) {
                if (ch.size() != m_frames) {
                    throw std::invalid_argument("pcm_buffer: channels differ in length");
                }
            }
        }
    }

    channels_t pcm_buffer::channels() const noexcept {
        return static_cast <channels_t>(m_channels.size());
    }

    sample_rate_t pcm_buffer::sample_rate() const noexcept {
        return m_sample_rate;
    }

    frames_t pcm_buffer::frames() const noexcept {
        return m_frames;
    }

    double pcm_buffer::duration() const noexcept {
        return static_cast <double>(m_frames) / static_cast <double>(m_sample_rate);
    }

    const float* pcm_buffer::channel_data(channels_t channel) const noexcept {
        return m_channels[channel].data();
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

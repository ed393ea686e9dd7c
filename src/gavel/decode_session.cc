// This is copyrighted software. More information is at the end of this file.
#include <gavel/decode_session.hh>
#include <gavel/codecs/decoder_opus.hh>
#include <gavel/sdk/io_stream.hh>
#include <gavel/error.hh>
#include <failsafe/failsafe.hh>

namespace gavel {
    namespace {
        constexpr size_t block_frames = 5760; // 120 ms at 48 kHz, the largest Opus frame
    }

    decode_session::decode_session(const decoder_factory_t& factory)
        : m_decoder(factory ? factory() : nullptr) {
        if (!m_decoder) {
            throw decode_error("No decoder available for the decode session");
        }
        LOG_INFO("decode_session", "Decoder session initialized with", m_decoder->get_name());
    }

    decode_session::~decode_session() = default;

    decoded_audio decode_session::decode(const std::vector <uint8_t>& encoded) {
        m_decodes++;

        auto stream = io_from_memory(encoded.data(), encoded.size());
        m_decoder->open(stream.get());

        decoded_audio out;
        const auto channels = static_cast <size_t>(m_decoder->get_channels());
        out.sample_rate = m_decoder->get_rate();
        if (channels == 0) {
            return out;
        }
        out.channel_data.resize(channels);

        m_block.grow(block_frames * channels);
        const size_t block = block_frames * channels;
        bool call_again = true;
        while (call_again) {
            const size_t got = m_decoder->decode(m_block.data(), block, call_again);
            const size_t frames = got / channels;
            for (size_t ch = 0; ch < channels; ch++) {
                auto& dst = out.channel_data[ch];
                dst.reserve(dst.size() + frames);
                for (size_t i = 0; i < frames; i++) {
                    dst.push_back(m_block[i * channels + ch]);
                }
            }
            out.frames += frames;
            if (got == 0) {
                break;
            }
        }
        return out;
    }

    void decode_session::reset() {
        if (m_decoder->is_open()) {
            m_decoder->close();
        }
    }

    const char* decode_session::decoder_name() const {
        return m_decoder->get_name();
    }

    size_t decode_session::decodes() const noexcept {
        return m_decodes;
    }

    decode_session::decoder_factory_t opus_decoder_factory() {
        return [] {
            return std::unique_ptr <decoder>(std::make_unique <decoder_opus>());
        };
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

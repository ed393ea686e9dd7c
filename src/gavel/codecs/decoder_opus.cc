// This is copyrighted software. More information is at the end of this file.
#include <gavel/codecs/decoder_opus.hh>
#include <gavel/sdk/io_stream.hh>
#include <gavel/error.hh>
#include <failsafe/failsafe.hh>

#include <opusfile.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

namespace gavel {
    namespace {
        const char* opusfile_error_name(int code) {
            switch (code) {
                case OP_EREAD: return "read failed";
                case OP_EFAULT: return "internal fault";
                case OP_EIMPL: return "unsupported feature";
                case OP_EINVAL: return "invalid argument";
                case OP_ENOTFORMAT: return "not an Ogg Opus stream";
                case OP_EBADHEADER: return "bad header";
                case OP_EVERSION: return "unsupported version";
                case OP_EBADLINK: return "bad link";
                case OP_EBADTIMESTAMP: return "bad timestamp";
                case OP_EBADPACKET: return "bad packet";
                case OP_EBADSTREAM: return "bad stream";
                case OP_ENOSEEK: return "stream not seekable";
                case OP_HOLE: return "hole in data";
                default: return "unknown error";
            }
        }
    }

    struct decoder_opus::impl {
        OggOpusFile* m_file = nullptr;
        std::vector <uint8_t> m_data;
        int m_channels = 0;
        ogg_int64_t m_total_frames = 0;

        ~impl() {
            release();
        }

        void release() {
            if (m_file) {
                op_free(m_file);
                m_file = nullptr;
            }
            m_data.clear();
            m_channels = 0;
            m_total_frames = 0;
        }

        void load_from_stream(io_stream* rwops) {
            m_data = read_all(rwops);
            if (m_data.empty()) {
                throw decode_error("Empty Opus stream");
            }

            int error = 0;
            m_file = op_open_memory(m_data.data(), m_data.size(), &error);
            if (!m_file) {
                m_data.clear();
                throw decode_error(std::string("Failed to open Opus stream: ") + opusfile_error_name(error));
            }

            m_channels = op_channel_count(m_file, -1);
            m_total_frames = op_pcm_total(m_file, -1);
            if (m_total_frames < 0) {
                // unseekable data has no known length
                m_total_frames = 0;
            }
        }
    };

    decoder_opus::decoder_opus()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder_opus::~decoder_opus() = default;

    bool decoder_opus::accept(io_stream* rwops) {
        if (!rwops) {
            return false;
        }
        const auto pos = rwops->tell();
        uint8_t page[64] = {};
        const auto got = rwops->read(page, sizeof(page));
        rwops->seek(pos, seek_origin::set);

        if (got < 27 || std::memcmp(page, "OggS", 4) != 0) {
            return false;
        }
        // first packet follows the 27 byte page header and its segment table
        const size_t packet = 27u + page[26];
        return got >= packet + 8 && std::memcmp(page + packet, "OpusHead", 8) == 0;
    }

    const char* decoder_opus::get_name() const {
        return "Opus";
    }

    void decoder_opus::open(io_stream* rwops) {
        if (is_open()) {
            close();
        }
        m_pimpl->load_from_stream(rwops);
        set_is_open(true);
        LOG_DEBUG("decoder_opus", "Opened stream:", m_pimpl->m_channels, "channels,",
                  m_pimpl->m_total_frames, "frames");
    }

    void decoder_opus::close() {
        m_pimpl->release();
        decoder::close();
    }

    channels_t decoder_opus::get_channels() const {
        return static_cast <channels_t>(m_pimpl->m_channels);
    }

    sample_rate_t decoder_opus::get_rate() const {
        return output_rate;
    }

    bool decoder_opus::rewind() {
        if (!is_open() || !m_pimpl->m_file) {
            return false;
        }
        return op_pcm_seek(m_pimpl->m_file, 0) == 0;
    }

    std::chrono::microseconds decoder_opus::duration() const {
        if (!is_open() || m_pimpl->m_total_frames == 0) {
            return std::chrono::microseconds(0);
        }
        return std::chrono::microseconds(m_pimpl->m_total_frames * 1'000'000 / output_rate);
    }

    size_t decoder_opus::do_decode(float buf[], size_t len, bool& call_again) {
        call_again = false;
        if (!m_pimpl->m_file) {
            return 0;
        }

        const auto channels = static_cast <size_t>(m_pimpl->m_channels);
        const auto capacity = static_cast <int>(std::min <size_t>(len, std::numeric_limits <int>::max()));

        // op_read_float stops at packet boundaries, so keep reading until the block is full
        size_t total = 0;
        while (total < len) {
            const int room = capacity - static_cast <int>(total);
            if (room < static_cast <int>(channels)) {
                break;
            }
            const int frames = op_read_float(m_pimpl->m_file, buf + total, room, nullptr);
            if (frames == OP_HOLE) {
                LOG_WARN("decoder_opus", "Skipping corrupt page");
                continue;
            }
            if (frames < 0) {
                throw decode_error(std::string("Opus decode failed: ") + opusfile_error_name(frames));
            }
            if (frames == 0) {
                return total;
            }
            total += static_cast <size_t>(frames) * channels;
        }
        call_again = true;
        return total;
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

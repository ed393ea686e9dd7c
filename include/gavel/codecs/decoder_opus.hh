// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <gavel/sdk/decoder.hh>
#include <gavel/sdk/types.hh>
#include <gavel/codecs/export_gavel_codecs.h>

namespace gavel {
    /*!
     * \brief Ogg Opus decoder using libopusfile
     * \ingroup codecs
     *
     * The whole file is pulled from the stream into memory on open(), then
     * handed to op_open_memory(). Output is always 48 kHz, whatever input
     * rate the encoder recorded in the header.
     *
     * ## Example Usage
     * \code{.cpp}
     * auto io = gavel::io_from_file("sounds/general/sfx-guilty.opus");
     * gavel::decoder_opus decoder;
     * decoder.open(io.get());
     *
     * std::vector<float> block(4096);
     * bool more = true;
     * while (more) {
     *     size_t n = decoder.decode(block.data(), block.size(), more);
     *     // ...
     * }
     * \endcode
     *
     * \see decoder, decode_session
     */
    class GAVEL_CODECS_EXPORT decoder_opus : public decoder {
        public:
            /// libopusfile always decodes at this rate
            static constexpr sample_rate_t output_rate = 48000;

            decoder_opus();
            ~decoder_opus() override;

            /*!
             * \brief Check for an Ogg page carrying an OpusHead packet
             *
             * The stream position is restored after checking.
             */
            [[nodiscard]] static bool accept(io_stream* rwops);

            [[nodiscard]] const char* get_name() const override;

            /*!
             * \throws gavel::decode_error if the stream is not valid Ogg Opus
             */
            void open(io_stream* rwops) override;

            void close() override;

            [[nodiscard]] channels_t get_channels() const override;
            [[nodiscard]] sample_rate_t get_rate() const override;
            bool rewind() override;
            [[nodiscard]] std::chrono::microseconds duration() const override;

        protected:
            size_t do_decode(float buf[], size_t len, bool& call_again) override;

        private:
            struct impl;
            std::unique_ptr <impl> m_pimpl;
    };
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

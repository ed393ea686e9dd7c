/**
 * @file decode_session.hh
 * @brief Reusable whole-file decode on a single decoder instance
 * @ingroup sources
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include <gavel/sdk/buffer.hh>
#include <gavel/sdk/decoder.hh>
#include <gavel/sdk/types.hh>
#include <gavel/export_gavel.h>

namespace gavel {
    /**
     * @struct decoded_audio
     * @brief Planar output of one decode_session::decode() call
     */
    struct decoded_audio {
        std::vector <std::vector <float>> channel_data;
        sample_rate_t sample_rate = 0;
        frames_t frames = 0;
    };

    /**
     * @class decode_session
     * @brief Owns one decoder and runs complete decodes on it
     *
     * The decoder is created once and reopened for every file. A session is
     * not reentrant: callers must not start a decode before the previous one
     * has returned, and must call reset() afterwards, successful or not.
     */
    class GAVEL_EXPORT decode_session {
        public:
            using decoder_factory_t = std::function <std::unique_ptr <decoder>()>;

            /**
             * @throws decode_error if the factory yields no decoder
             */
            explicit decode_session(const decoder_factory_t& factory);
            ~decode_session();

            decode_session(const decode_session&) = delete;
            decode_session& operator=(const decode_session&) = delete;

            /**
             * @brief Decode a complete encoded file held in memory
             *
             * Interleaved decoder output is split into one vector per channel.
             *
             * @throws decode_error if the decoder rejects the data
             */
            [[nodiscard]] decoded_audio decode(const std::vector <uint8_t>& encoded);

            /**
             * @brief Close the decoder and drop per-file state
             */
            void reset();

            [[nodiscard]] const char* decoder_name() const;

            /**
             * @brief Number of decode() calls made on this session
             */
            [[nodiscard]] size_t decodes() const noexcept;

        private:
            std::unique_ptr <decoder> m_decoder;
            buffer <float> m_block{0};
            size_t m_decodes = 0;
    };

    /**
     * @brief Factory producing decoder_opus instances
     */
    GAVEL_EXPORT decode_session::decoder_factory_t opus_decoder_factory();
}

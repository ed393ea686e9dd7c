/**
 * @file pcm_buffer.hh
 * @brief Fully decoded, planar audio
 * @ingroup sources
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <memory>
#include <vector>
#include <gavel/sdk/types.hh>
#include <gavel/export_gavel.h>

namespace gavel {
    /**
     * @class pcm_buffer
     * @brief Planar float samples plus their sample rate
     * @ingroup sources
     *
     * Produced once by the software decoder and shared, read-only, between
     * the decode cache and every render node playing it. All channels have
     * the same number of frames.
     */
    class GAVEL_EXPORT pcm_buffer {
        public:
            /**
             * @param channel_data One sample vector per channel
             * @param sample_rate Rate of the samples in Hz
             * @throws std::invalid_argument if the channels differ in length or
             *         the sample rate is zero
             */
            pcm_buffer(std::vector <std::vector <float>> channel_data, sample_rate_t sample_rate);

            [[nodiscard]] channels_t channels() const noexcept;
            [[nodiscard]] sample_rate_t sample_rate() const noexcept;
            [[nodiscard]] frames_t frames() const noexcept;

            /**
             * @brief Length in seconds (frames / sample_rate)
             */
            [[nodiscard]] double duration() const noexcept;

            /**
             * @pre channel < channels()
             */
            [[nodiscard]] const float* channel_data(channels_t channel) const noexcept;

        private:
            std::vector <std::vector <float>> m_channels;
            sample_rate_t m_sample_rate;
            frames_t m_frames;
    };

    using pcm_buffer_ptr = std::shared_ptr <const pcm_buffer>;
}

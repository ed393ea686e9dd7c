/**
 * @file channel_pool.hh
 * @brief Fixed collections of playback channels used by the courtroom
 * @ingroup handles
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <gavel/playback_handle.hh>
#include <gavel/export_gavel.h>

namespace gavel {
    class channel_router;

    /**
     * @class channel_pool
     * @brief Ordered, fixed-size sequence of handles
     *
     * Addressed by index (music) or in rotation (blips). The pool never grows
     * after construction.
     */
    class GAVEL_EXPORT channel_pool {
        public:
            channel_pool() = default;
            explicit channel_pool(std::vector <std::shared_ptr <playback_handle>> handles);

            [[nodiscard]] size_t size() const noexcept;
            [[nodiscard]] bool empty() const noexcept;

            /**
             * @return Handle at @p index, or nullptr if there is none
             */
            [[nodiscard]] std::shared_ptr <playback_handle> at(int index) const;

            /**
             * @brief Pick the next blip channel
             *
             * Takes the first paused handle at or after the rotation cursor,
             * or the handle under the cursor if all are busy, and advances the
             * cursor past it.
             *
             * @return nullptr for an empty pool
             */
            std::shared_ptr <playback_handle> next();

            void set_volume(float v);

            [[nodiscard]] const std::vector <std::shared_ptr <playback_handle>>& handles() const noexcept;

        private:
            std::vector <std::shared_ptr <playback_handle>> m_handles;
            size_t m_cursor = 0;
    };

    /**
     * @struct host_channels
     * @brief The host's own elements, before routing
     */
    struct host_channels {
        std::vector <std::shared_ptr <playback_handle>> music;
        std::vector <std::shared_ptr <playback_handle>> blips;
        std::shared_ptr <playback_handle> sfx;
        std::shared_ptr <playback_handle> shout;
        std::shared_ptr <playback_handle> testimony;
    };

    /**
     * @class courtroom_channels
     * @brief Every playback channel of a courtroom view
     * @ingroup handles
     *
     * Built once at startup. Each host element is wrapped by the router;
     * music and blip channels start at their configured volume and report
     * errors through the optional hook. The dedicated channels get their
     * default sources relative to the asset host prefix.
     */
    class GAVEL_EXPORT courtroom_channels {
        public:
            using error_hook_t = std::function <void(const std::string& channel, playback_handle& handle)>;

            static constexpr const char* default_sfx = "sounds/general/sfx-realization.opus";
            static constexpr const char* default_shout = "misc/default/objection.opus";
            static constexpr const char* default_testimony = "sounds/general/sfx-guilty.opus";

            courtroom_channels(channel_router& router,
                               host_channels host,
                               const std::string& asset_host,
                               float music_volume = 0.5f,
                               float blip_volume = 0.5f,
                               error_hook_t on_error = nullptr);

            [[nodiscard]] channel_pool& music() noexcept;
            [[nodiscard]] channel_pool& blips() noexcept;

            /**
             * @brief Music channel @p index, nullptr if out of range
             */
            [[nodiscard]] std::shared_ptr <playback_handle> music_channel(int index) const;

            [[nodiscard]] const std::shared_ptr <playback_handle>& sfx() const noexcept;
            [[nodiscard]] const std::shared_ptr <playback_handle>& shout() const noexcept;
            [[nodiscard]] const std::shared_ptr <playback_handle>& testimony() const noexcept;

            void set_music_volume(float v);
            void set_blip_volume(float v);

        private:
            std::vector <std::shared_ptr <playback_handle>> build(channel_router& router,
                                                                  std::vector <std::shared_ptr <playback_handle>> host,
                                                                  const char* name,
                                                                  float volume);
            std::shared_ptr <playback_handle> build_single(channel_router& router,
                                                           std::shared_ptr <playback_handle> host,
                                                           const std::string& source);

            error_hook_t m_on_error;
            channel_pool m_music;
            channel_pool m_blips;
            std::shared_ptr <playback_handle> m_sfx;
            std::shared_ptr <playback_handle> m_shout;
            std::shared_ptr <playback_handle> m_testimony;
    };
}

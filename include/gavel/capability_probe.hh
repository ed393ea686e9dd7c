/**
 * @file capability_probe.hh
 * @brief Runtime check for native Opus playback
 * @ingroup core
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <gavel/export_gavel.h>

namespace gavel {
    /**
     * @class media_capabilities
     * @brief The host media layer's answer to "can you play this type?"
     *
     * Answers follow the media element convention: "probably", "maybe" or
     * the empty string.
     */
    class GAVEL_EXPORT media_capabilities {
        public:
            virtual ~media_capabilities() = default;

            [[nodiscard]] virtual std::string can_play_type(const std::string& mime) const = 0;
    };

    /**
     * @class static_media_capabilities
     * @brief Fixed table of MIME types reported as "probably"
     *
     * Used when the host media layer is configured rather than queried, for
     * example from engine_config::native_mime_types.
     */
    class GAVEL_EXPORT static_media_capabilities : public media_capabilities {
        public:
            explicit static_media_capabilities(std::vector <std::string> probably);

            [[nodiscard]] std::string can_play_type(const std::string& mime) const override;

        private:
            std::vector <std::string> m_probably;
    };

    /**
     * @class capability_probe
     * @brief Decides whether Opus sources need the software decoder
     * @ingroup core
     *
     * The codec counts as native only if the host answers "probably" for
     * Ogg or WebM Opus. Lack of support is a normal answer, not an error.
     */
    class GAVEL_EXPORT capability_probe {
        public:
            static constexpr const char* ogg_opus_mime = "audio/ogg; codecs=\"opus\"";
            static constexpr const char* webm_opus_mime = "audio/webm; codecs=\"opus\"";

            explicit capability_probe(std::shared_ptr <const media_capabilities> host);

            /**
             * @brief Ask the host; not cached
             */
            [[nodiscard]] bool supports_codec_natively() const;

            /**
             * @brief Negation of supports_codec_natively(), computed once
             *
             * Logs once when software decoding gets enabled.
             */
            [[nodiscard]] bool needs_software_decoding();

        private:
            std::shared_ptr <const media_capabilities> m_host;
            std::optional <bool> m_needs_software;
    };
}

/**
 * @file config.hh
 * @brief Engine settings
 * @ingroup core
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <gavel/sdk/audio_format.hh>
#include <gavel/export_gavel.h>

namespace gavel {
    /**
     * @struct engine_config
     * @brief Everything audio_engine needs to know at construction
     */
    struct GAVEL_EXPORT engine_config {
        /// requested output format, the device may pick something else
        audio_spec output{audio_format::f32le, 2, 48000};
        std::string device_id = "default";

        /// base directory for relative source URIs
        std::string asset_root;

        std::chrono::milliseconds readiness_delay{100};
        std::chrono::milliseconds load_poll_interval{10};

        float music_volume = 0.5f;
        float blip_volume = 0.5f;

        /// MIME types the host plays natively; empty means no native Opus
        std::vector <std::string> native_mime_types;

        /**
         * @brief Defaults overlaid with GAVEL_ASSET_ROOT and GAVEL_READINESS_DELAY_MS
         *
         * Malformed values are logged and ignored.
         */
        static engine_config from_environment();
    };
}

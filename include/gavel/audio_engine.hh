/**
 * @file audio_engine.hh
 * @brief Process-wide owner of the playback stack
 * @ingroup core
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <gavel/config.hh>
#include <gavel/channel_pool.hh>
#include <gavel/remote_offset_sync.hh>
#include <gavel/export_gavel.h>

namespace gavel {
    class audio_backend;
    class audio_context;
    class capability_probe;
    class channel_router;
    class event_loop;
    class fetcher;
    class media_capabilities;
    class software_decoder;
    class software_handle;

    /**
     * @class audio_engine
     * @brief Owns the output context, the software decoder and the capability probe
     * @ingroup core
     *
     * There is one engine per process. Channels, routers and synchronizers
     * receive references to its parts instead of reaching for globals.
     *
     * Lifetime: software handles, courtroom_channels and synchronizers
     * created here refer to the engine's context and decoder, so they must
     * be released before the engine is destroyed. A synchronizer also refers
     * to the courtroom_channels it was created for; do not move or destroy
     * those channels while the synchronizer is in use.
     *
     * @code
     * event_loop loop;
     * auto cfg = engine_config::from_environment();
     * audio_engine engine(loop, create_sdl3_backend(), cfg);
     * engine.init_software_decoding();
     *
     * auto channels = engine.create_courtroom(host, "https://assets.example/");
     * auto sync = engine.create_synchronizer(channels);
     * sync.apply(parse_remote_offset_command(fields));
     * @endcode
     */
    class GAVEL_EXPORT audio_engine {
        public:
            /**
             * @param loop Loop every asynchronous step runs on
             * @param backend Output backend, initialized here if needed
             * @param cfg Settings
             * @param transport Source of encoded bytes; defaults to a file_fetcher on cfg.asset_root
             * @param host Native codec table; defaults to cfg.native_mime_types
             * @throws device_error if the output device cannot be opened
             */
            audio_engine(event_loop& loop,
                         std::shared_ptr <audio_backend> backend,
                         engine_config cfg = {},
                         std::shared_ptr <fetcher> transport = nullptr,
                         std::shared_ptr <const media_capabilities> host = nullptr);
            ~audio_engine();

            audio_engine(const audio_engine&) = delete;
            audio_engine& operator=(const audio_engine&) = delete;

            [[nodiscard]] const engine_config& config() const noexcept;
            [[nodiscard]] event_loop& loop() const noexcept;
            [[nodiscard]] audio_context& context() const noexcept;
            [[nodiscard]] software_decoder& decoder() const noexcept;
            [[nodiscard]] capability_probe& probe() const noexcept;
            [[nodiscard]] channel_router& router() const noexcept;

            /**
             * @brief A standalone software handle on this engine's context
             *
             * The handle must not outlive the engine.
             */
            [[nodiscard]] std::shared_ptr <software_handle> create_software_handle() const;

            /**
             * @brief Wrap the host's elements into courtroom channels
             *
             * Music and blip volumes come from the configuration. The channels
             * must not outlive the engine.
             */
            [[nodiscard]] courtroom_channels create_courtroom(host_channels host,
                                                              const std::string& asset_host,
                                                              courtroom_channels::error_hook_t on_error = nullptr);

            /**
             * @brief Synchronizer addressing the music channels of @p channels
             *
             * @p channels must outlive the synchronizer and stay at the same
             * address while it is used.
             */
            [[nodiscard]] remote_offset_sync create_synchronizer(courtroom_channels& channels) const;

            /**
             * @brief Create the decode session early when software decoding is needed
             *
             * @p done receives true once the decoder is ready, false if it is
             * not needed or failed to start.
             */
            void init_software_decoding(std::function <void(bool)> done = nullptr);

            /**
             * @brief Resume the output context on the first user gesture
             *
             * Later calls do nothing.
             */
            void notify_user_interaction();

        private:
            struct impl;
            std::unique_ptr <impl> m_pimpl;
    };
}

/**
 * @file channel_router.hh
 * @brief Native-or-software dispatch for playback handles
 * @ingroup handles
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <functional>
#include <memory>
#include <vector>
#include <gavel/playback_handle.hh>
#include <gavel/export_gavel.h>

namespace gavel {
    class capability_probe;

    /**
     * @class routed_handle
     * @brief Facade over a native handle and its software companion
     * @ingroup handles
     *
     * The source decides which inner handle is active: a ".opus" URI selects
     * the software handle, anything else the native one. The source examined
     * is the native handle's, or the software handle's when the native one
     * is empty.
     *
     * - reads and play / pause / load go to the active handle only
     * - writes (source, volume, loop, current_time) go to both
     * - listeners on the facade hear only the handle active at emit time
     */
    class GAVEL_EXPORT routed_handle : public playback_handle {
        public:
            routed_handle(std::shared_ptr <playback_handle> native,
                          std::shared_ptr <playback_handle> software);
            ~routed_handle() override;

            routed_handle(const routed_handle&) = delete;
            routed_handle& operator=(const routed_handle&) = delete;

            [[nodiscard]] handle_kind kind() const override;
            [[nodiscard]] handle_kind active_kind() const override;

            /**
             * @brief The inner handle serving the current source
             */
            [[nodiscard]] playback_handle& active() const;

            [[nodiscard]] const std::shared_ptr <playback_handle>& native() const noexcept;
            [[nodiscard]] const std::shared_ptr <playback_handle>& software() const noexcept;

            [[nodiscard]] std::string source() const override;
            void set_source(const std::string& uri) override;

            [[nodiscard]] float volume() const override;
            void set_volume(float v) override;

            [[nodiscard]] bool loop() const override;
            void set_loop(bool loop) override;

            [[nodiscard]] bool paused() const override;

            [[nodiscard]] double current_time() const override;
            void set_current_time(double seconds) override;

            [[nodiscard]] double duration() const override;

            void play() override;
            void pause() override;
            void load() override;

            [[nodiscard]] std::exception_ptr error() const override;

        private:
            void subscribe(playback_handle& inner, std::vector <listener_id>& ids);

            std::shared_ptr <playback_handle> m_native;
            std::shared_ptr <playback_handle> m_software;
            std::vector <listener_id> m_native_listeners;
            std::vector <listener_id> m_software_listeners;
    };

    /**
     * @class channel_router
     * @brief Wraps host handles so Opus sources play without native support
     * @ingroup handles
     */
    class GAVEL_EXPORT channel_router {
        public:
            using software_factory_t = std::function <std::shared_ptr <playback_handle>()>;

            channel_router(capability_probe& probe, software_factory_t make_software);

            /**
             * @brief Route @p native through a software companion when needed
             *
             * With native Opus support @p native is returned unchanged.
             * Otherwise a routed_handle is returned whose software handle
             * starts with the native handle's volume and loop flag.
             *
             * @throws std::invalid_argument if @p native is null
             */
            [[nodiscard]] std::shared_ptr <playback_handle> wrap(std::shared_ptr <playback_handle> native);

        private:
            capability_probe& m_probe;
            software_factory_t m_make_software;
    };
}

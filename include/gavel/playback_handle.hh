/**
 * @file playback_handle.hh
 * @brief Common interface of every playable channel
 * @ingroup handles
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>
#include <gavel/export_gavel.h>

namespace gavel {
    /**
     * @brief Notifications a handle delivers to its listeners
     */
    enum class playback_event {
        error,
        ended,
        loaded,
        loaded_metadata,
        play,
        pause
    };

    GAVEL_EXPORT const char* to_string(playback_event ev);
    GAVEL_EXPORT std::ostream& operator<<(std::ostream& os, playback_event ev);

    enum class handle_kind {
        native,   ///< decoded by the host media layer
        software, ///< decoded by gavel and rendered through the audio context
        routed    ///< facade choosing between the two per source
    };

    /**
     * @brief True when @p uri must be decoded in software (trailing ".opus")
     */
    [[nodiscard]] GAVEL_EXPORT bool is_software_source(const std::string& uri);

    /**
     * @brief Clamp to [0, 1], NaN becomes 0
     */
    [[nodiscard]] GAVEL_EXPORT float clamp_volume(float v) noexcept;

    /**
     * @class playback_handle
     * @brief A channel that plays one source at a time
     * @ingroup handles
     *
     * Modeled on a media element: a source URI, volume, loop flag, paused
     * flag, playback position and duration, plus play / pause / load and
     * listeners for the events above.
     *
     * Failures never propagate out of these methods. They surface as an
     * error event and, for software handles, through error().
     *
     * All methods must be called on the thread running the event loop, and
     * listeners are invoked on it.
     *
     * @code
     * auto id = handle->add_listener(playback_event::ended, [](playback_event) {
     *     LOG_INFO("demo", "done");
     * });
     * handle->set_source("sounds/general/sfx-guilty.opus");
     * handle->play();
     * // ...
     * handle->remove_listener(id);
     * @endcode
     */
    class GAVEL_EXPORT playback_handle {
        public:
            using listener_t = std::function <void(playback_event)>;
            using listener_id = uint64_t;

            virtual ~playback_handle();

            [[nodiscard]] virtual handle_kind kind() const = 0;

            /**
             * @brief Kind of the handle actually serving the current source
             *
             * Same as kind() except for facades, which report their active
             * inner handle.
             */
            [[nodiscard]] virtual handle_kind active_kind() const;

            [[nodiscard]] virtual std::string source() const = 0;
            virtual void set_source(const std::string& uri) = 0;

            [[nodiscard]] virtual float volume() const = 0;
            virtual void set_volume(float v) = 0;

            [[nodiscard]] virtual bool loop() const = 0;
            virtual void set_loop(bool loop) = 0;

            [[nodiscard]] virtual bool paused() const = 0;

            /**
             * @brief Playback position in seconds
             */
            [[nodiscard]] virtual double current_time() const = 0;
            virtual void set_current_time(double seconds) = 0;

            /**
             * @brief Length of the loaded source in seconds, 0 until loaded
             */
            [[nodiscard]] virtual double duration() const = 0;

            /**
             * @brief Start or resume playback; completes asynchronously
             */
            virtual void play() = 0;
            virtual void pause() = 0;

            /**
             * @brief (Re)load the current source
             */
            virtual void load() = 0;

            /**
             * @brief Failure of the most recent load or play, if any
             */
            [[nodiscard]] virtual std::exception_ptr error() const = 0;

            /**
             * @brief Register @p fn for @p ev
             * @return Id to pass to remove_listener()
             */
            listener_id add_listener(playback_event ev, listener_t fn);

            /**
             * @brief Unregister a listener; unknown ids are ignored
             *
             * Safe to call from inside a listener, including the one being removed.
             */
            void remove_listener(listener_id id);

            [[nodiscard]] size_t listener_count() const noexcept;

        protected:
            /**
             * @brief Invoke every listener registered for @p ev
             */
            void emit(playback_event ev);

        private:
            struct listener {
                listener_id id;
                playback_event event;
                listener_t fn;
            };

            std::vector <listener> m_listeners;
            listener_id m_next_id = 1;
    };

    /**
     * @class native_handle
     * @brief Handle whose decoding and output belong to the host
     * @ingroup handles
     *
     * The embedding application derives from this class to wrap its own
     * media element. It reports element events by calling notify().
     */
    class GAVEL_EXPORT native_handle : public playback_handle {
        public:
            [[nodiscard]] handle_kind kind() const final;

            /**
             * @brief Forward an event raised by the host element
             */
            void notify(playback_event ev);
    };
}

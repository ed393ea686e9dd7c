/**
 * @file remote_offset_sync.hh
 * @brief Drift-compensated "play at offset" for network commands
 * @ingroup core
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <gavel/export_gavel.h>

namespace gavel {
    class event_loop;
    class playback_handle;

    /**
     * @struct remote_offset_command
     * @brief "Play channel N from T seconds" as received from the server
     */
    struct remote_offset_command {
        double offset_seconds = 0.0;
        int channel = 0;
    };

    /**
     * @brief Parse the wire fields [name, offset, channel]
     *
     * Missing or unparsable offset and channel fields read as 0. A channel
     * that is not a whole number maps to -1, which addresses no channel.
     */
    GAVEL_EXPORT remote_offset_command parse_remote_offset_command(const std::vector <std::string>& fields);

    /**
     * @class remote_offset_sync
     * @brief Seeks a channel to a remote offset plus the time spent loading
     * @ingroup core
     *
     * The channel is paused right away. Once it is ready the elapsed time
     * since the command is added to the target offset, the position is set
     * and playback starts. Readiness is the next "loaded_metadata" event for
     * handles decoded natively; software decoded handles do not announce it,
     * so a fixed delay stands in for it.
     *
     * @code
     * remote_offset_sync sync(loop, [&](int ch) { return channels.music_channel(ch); });
     * sync.apply(parse_remote_offset_command({"RMC", "5.0", "0"}));
     * @endcode
     */
    class GAVEL_EXPORT remote_offset_sync {
        public:
            using channel_lookup_t = std::function <std::shared_ptr <playback_handle>(int)>;

            static constexpr std::chrono::milliseconds default_readiness_delay{100};

            remote_offset_sync(event_loop& loop,
                               channel_lookup_t lookup,
                               std::chrono::milliseconds readiness_delay = default_readiness_delay);

            /**
             * @brief Pause, wait for readiness, seek to target + drift, play
             *
             * An index with no channel is ignored.
             */
            void apply_remote_offset(int channel, double target_offset_seconds);

            void apply(const remote_offset_command& cmd);

            [[nodiscard]] std::chrono::milliseconds readiness_delay() const noexcept;

        private:
            event_loop& m_loop;
            channel_lookup_t m_lookup;
            std::chrono::milliseconds m_readiness_delay;
    };
}

/**
 * @file audio_context.hh
 * @brief Shared output context that plays decoded buffers
 * @ingroup core
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <gavel/pcm_buffer.hh>
#include <gavel/sdk/audio_backend.hh>
#include <gavel/sdk/audio_format.hh>
#include <gavel/export_gavel.h>

namespace gavel {
    class event_loop;
    class audio_context;

    /**
     * @class gain_node
     * @brief Volume stage between a buffer source and the output
     *
     * The gain is read by the audio thread on every callback, so changes
     * take effect on the next rendered block.
     */
    class GAVEL_EXPORT gain_node {
        public:
            explicit gain_node(float gain = 1.0f);

            void set_gain(float gain) noexcept;
            [[nodiscard]] float gain() const noexcept;

        private:
            std::atomic <float> m_gain;
    };

    /**
     * @class buffer_source_node
     * @brief One-shot player of a pcm_buffer
     * @ingroup core
     *
     * A node is started at most once. Playing from another position means
     * creating a new node. When a non-looping node runs past the end of its
     * buffer, the ended callback is posted to the event loop. stop() never
     * triggers the ended callback.
     */
    class GAVEL_EXPORT buffer_source_node : public std::enable_shared_from_this <buffer_source_node> {
        friend class audio_context;
        public:
            using ended_callback_t = std::function <void()>;

            ~buffer_source_node();

            buffer_source_node(const buffer_source_node&) = delete;
            buffer_source_node& operator=(const buffer_source_node&) = delete;

            /**
             * @brief Start rendering at @p offset seconds into the buffer
             *
             * Calling start() on a node that was already started is ignored.
             */
            void start(double offset);

            /**
             * @brief Remove the node from the output
             */
            void stop();

            void set_loop(bool loop);
            [[nodiscard]] bool loop() const;

            /**
             * @brief Callback invoked on the event loop after a natural end
             */
            void set_on_ended(ended_callback_t cb);

            /**
             * @brief Started, and neither stopped nor ended
             */
            [[nodiscard]] bool active() const;

            [[nodiscard]] const pcm_buffer_ptr& buffer() const noexcept;

        private:
            struct graph;

            buffer_source_node(std::weak_ptr <graph> owner,
                               pcm_buffer_ptr buffer,
                               std::shared_ptr <gain_node> gain);

            std::weak_ptr <graph> m_graph;
            pcm_buffer_ptr m_buffer;
            std::shared_ptr <gain_node> m_gain;
            ended_callback_t m_on_ended;

            // guarded by the graph mutex
            double m_position = 0.0;
            bool m_loop = false;
            bool m_started = false;
            bool m_active = false;
    };

    /**
     * @class audio_context
     * @brief Owner of the output device, the render graph and the audio clock
     * @ingroup core
     *
     * The context opens one device through an audio_backend and mixes every
     * active buffer_source_node into it from the backend's audio thread.
     * Mono sources are copied to every output channel; sources whose rate
     * differs from the device rate are stepped with linear interpolation.
     *
     * The context starts suspended, as a browser context does before any
     * user gesture. While suspended nothing is rendered and the audio clock
     * stands still.
     *
     * @code
     * audio_context ctx(loop, backend, {audio_format::f32le, 2, 48000});
     * ctx.resume([] { LOG_INFO("demo", "running"); });
     * auto gain = ctx.create_gain();
     * auto src = ctx.create_buffer_source(buffer, gain);
     * src->start(0.0);
     * @endcode
     */
    class GAVEL_EXPORT audio_context {
        public:
            enum class state {
                suspended,
                running,
                closed
            };

            /**
             * @param loop Loop receiving ended notifications and resume completions
             * @param backend Initialized backend
             * @param wanted Requested output format
             * @param device_id Backend device id
             * @throws device_error if the backend is missing or uninitialized, or
             *         the device cannot be opened
             */
            audio_context(event_loop& loop,
                          std::shared_ptr <audio_backend> backend,
                          const audio_spec& wanted,
                          const std::string& device_id = "default");
            ~audio_context();

            audio_context(const audio_context&) = delete;
            audio_context& operator=(const audio_context&) = delete;

            [[nodiscard]] state get_state() const;

            /**
             * @brief Start the device stream
             *
             * @p done is posted to the event loop once the context runs. A
             * closed context never resumes, and @p done still runs.
             */
            void resume(std::function <void()> done = nullptr);

            void suspend();

            /**
             * @brief Stop every node and release the device
             */
            void close();

            /**
             * @brief Audio clock in seconds: frames rendered / device rate
             */
            [[nodiscard]] double current_time() const;

            /**
             * @brief Format the device actually runs at
             */
            [[nodiscard]] audio_spec get_spec() const;

            [[nodiscard]] std::shared_ptr <gain_node> create_gain(float gain = 1.0f) const;

            [[nodiscard]] std::shared_ptr <buffer_source_node> create_buffer_source(
                pcm_buffer_ptr buffer,
                std::shared_ptr <gain_node> gain);

            /**
             * @brief Number of nodes currently mixed into the output
             */
            [[nodiscard]] size_t active_sources() const;

            [[nodiscard]] event_loop& loop() const;

        private:
            static void render_callback(void* userdata, uint8_t* out, int len);

            std::shared_ptr <buffer_source_node::graph> m_graph;
    };
}

/**
 * @file software_handle.hh
 * @brief Playback handle decoding through gavel and rendering via the audio context
 * @ingroup handles
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <gavel/playback_handle.hh>
#include <gavel/pcm_buffer.hh>
#include <gavel/export_gavel.h>

namespace gavel {
    class audio_context;
    class buffer_source_node;
    class gain_node;
    class software_decoder;

    /**
     * @class software_handle
     * @brief Media-element look-alike backed by a decoded pcm_buffer
     * @ingroup handles
     *
     * ## Load states
     *
     * | State   | Entered when                                   |
     * |---------|------------------------------------------------|
     * | empty   | source is not a ".opus" URI                    |
     * | loading | a ".opus" source was assigned or load() called |
     * | ready   | the decoder delivered a buffer                 |
     * | errored | fetch or decode failed                         |
     *
     * Assigning a new source while a load is in flight supersedes it: the
     * late result of the older load is dropped.
     *
     * ## Playback
     *
     * play() resumes the audio context, waits for any in-flight load by
     * polling, then starts a new buffer_source_node at current_time(). While
     * playing, current_time() is derived from the audio clock. Each started
     * node reports its end at most once, and only the most recently started
     * node can end the handle, so `ended` fires once per natural end and
     * never while looping.
     */
    class GAVEL_EXPORT software_handle : public playback_handle {
        public:
            enum class load_state {
                empty,
                loading,
                ready,
                errored
            };

            static constexpr std::chrono::milliseconds default_poll_interval{10};

            software_handle(audio_context& ctx,
                            software_decoder& decoder,
                            std::chrono::milliseconds poll_interval = default_poll_interval);
            ~software_handle() override;

            software_handle(const software_handle&) = delete;
            software_handle& operator=(const software_handle&) = delete;

            [[nodiscard]] handle_kind kind() const override;

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

            [[nodiscard]] load_state state() const noexcept;

        private:
            void load_audio(const std::string& uri);
            void on_loaded(const std::string& uri, pcm_buffer_ptr buffer, std::exception_ptr error);
            void await_load(uint64_t play_token);
            void finish_play();
            void start_from(double offset);
            void stop_node();
            void on_node_ended(const std::shared_ptr <buffer_source_node>& node);

            audio_context& m_ctx;
            software_decoder& m_decoder;
            std::chrono::milliseconds m_poll_interval;

            std::string m_source;
            float m_volume = 1.0f;
            bool m_loop = false;
            bool m_paused = true;
            double m_current_time = 0.0;
            double m_duration = 0.0;

            load_state m_state = load_state::empty;
            std::exception_ptr m_error;
            pcm_buffer_ptr m_buffer;
            uint64_t m_load_generation = 0;
            uint64_t m_play_token = 0;

            std::shared_ptr <gain_node> m_gain;
            std::shared_ptr <buffer_source_node> m_node;
            double m_start_time = 0.0;

            std::shared_ptr <software_handle*> m_self;
    };
}

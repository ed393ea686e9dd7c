/**
 * @file software_decoder.hh
 * @brief Asynchronous "uri in, PCM out" decoding with caching
 * @ingroup sources
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <gavel/decode_cache.hh>
#include <gavel/decode_session.hh>
#include <gavel/fetcher.hh>
#include <gavel/pcm_buffer.hh>
#include <gavel/export_gavel.h>

namespace gavel {
    class event_loop;

    /**
     * @class software_decoder
     * @brief Fetches and decodes sources the host cannot play natively
     * @ingroup sources
     *
     * Results are cached by URI. Concurrent requests for the same URI share
     * a single fetch and decode; requests for different URIs queue up and
     * run one at a time on the shared decode session, which is created on
     * first use.
     *
     * Every completion runs on the event loop, never synchronously inside
     * decode(), and carries either a buffer or an exception:
     * - fetch_error when the fetcher reports a non-success status
     * - decode_error when the data decodes to no samples or is not Opus
     *
     * @code
     * dec.decode("sounds/general/sfx-guilty.opus",
     *            [](pcm_buffer_ptr buf, std::exception_ptr err) {
     *                if (err) { ... } else { ... }
     *            });
     * @endcode
     */
    class GAVEL_EXPORT software_decoder {
        public:
            using completion_t = std::function <void(pcm_buffer_ptr, std::exception_ptr)>;
            using ready_callback_t = std::function <void(std::exception_ptr)>;

            software_decoder(event_loop& loop,
                             fetcher& source,
                             decode_session::decoder_factory_t factory = opus_decoder_factory(),
                             std::size_t cache_capacity = decode_cache::default_capacity);
            ~software_decoder();

            software_decoder(const software_decoder&) = delete;
            software_decoder& operator=(const software_decoder&) = delete;

            void decode(const std::string& uri, completion_t done);

            /**
             * @brief Create the decode session ahead of the first decode
             *
             * @p done runs on the event loop once the session is ready, or
             * with the exception that prevented its creation.
             */
            void prepare(ready_callback_t done);

            [[nodiscard]] bool session_ready() const noexcept;

            [[nodiscard]] const decode_cache& cache() const noexcept;

            /**
             * @brief URIs fetched or decoded right now or waiting in the queue
             */
            [[nodiscard]] std::size_t in_flight() const noexcept;

        private:
            void pump();
            void run_job(const std::string& uri);
            void with_session(ready_callback_t next);
            void on_fetched(const std::string& uri, fetch_response response);
            void finish(const std::string& uri, const pcm_buffer_ptr& buffer, const std::exception_ptr& error);

            event_loop& m_loop;
            fetcher& m_fetcher;
            decode_session::decoder_factory_t m_factory;
            decode_cache m_cache;
            std::unique_ptr <decode_session> m_session;
            std::unordered_map <std::string, std::vector <completion_t>> m_waiters;
            std::deque <std::string> m_jobs;
            bool m_busy = false;
            std::shared_ptr <software_decoder*> m_self;
    };
}

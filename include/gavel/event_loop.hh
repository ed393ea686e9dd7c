/**
 * @file event_loop.hh
 * @brief Cooperative task queue with timers
 * @ingroup core
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <gavel/export_gavel.h>

namespace gavel {

    /**
     * @class clock_source
     * @brief Wall clock used for timers and drift measurement
     *
     * Tests substitute a manually advanced clock so timer expiry and drift
     * are deterministic.
     */
    class GAVEL_EXPORT clock_source {
        public:
            using duration = std::chrono::microseconds;

            virtual ~clock_source() = default;

            /**
             * @brief Time elapsed since an arbitrary, fixed epoch
             */
            [[nodiscard]] virtual duration now() const = 0;
    };

    /**
     * @brief clock_source backed by std::chrono::steady_clock
     */
    class GAVEL_EXPORT steady_clock_source : public clock_source {
        public:
            steady_clock_source();
            [[nodiscard]] duration now() const override;

        private:
            std::chrono::steady_clock::time_point m_epoch;
    };

    /**
     * @class event_loop
     * @brief Single consumer task queue driving every asynchronous step
     * @ingroup core
     *
     * All handle state, decode jobs and synchronizer continuations run on
     * the thread that calls run_pending(). Other threads (the backend's
     * audio thread, a network fetcher) only post() into the queue.
     *
     * @code
     * event_loop loop;
     * loop.post_delayed(100ms, [] { LOG_INFO("demo", "tick"); });
     * loop.run_until([] { return false; }, 200ms);
     * @endcode
     */
    class GAVEL_EXPORT event_loop {
        public:
            using task_t = std::function <void()>;

            explicit event_loop(std::shared_ptr <clock_source> clock = nullptr);
            ~event_loop();

            event_loop(const event_loop&) = delete;
            event_loop& operator=(const event_loop&) = delete;

            [[nodiscard]] const clock_source& clock() const;

            /**
             * @brief Current clock value in seconds
             */
            [[nodiscard]] double now_seconds() const;

            /**
             * @brief Queue a task for the next run_pending(). Thread-safe.
             */
            void post(task_t task);

            /**
             * @brief Queue a task that becomes runnable once @p delay has elapsed. Thread-safe.
             */
            void post_delayed(clock_source::duration delay, task_t task);

            /**
             * @brief Run every runnable task, including ones posted while running
             *
             * Timers are taken in deadline order; timers with equal deadlines
             * run in the order they were posted.
             *
             * @return Number of tasks executed
             */
            size_t run_pending();

            /**
             * @brief Deadline of the earliest timer, if any
             */
            [[nodiscard]] std::optional <clock_source::duration> next_deadline() const;

            /**
             * @brief Nothing queued and no timers armed
             */
            [[nodiscard]] bool idle() const;

            /**
             * @brief Keep running tasks until @p done returns true or @p timeout passes
             *
             * Sleeps between timer deadlines. Intended for applications and
             * examples that own the main thread.
             *
             * @return Value of done() when returning
             */
            bool run_until(const std::function <bool()>& done, std::chrono::milliseconds timeout);

        private:
            struct timer {
                clock_source::duration deadline;
                uint64_t sequence;
                task_t task;
            };

            std::shared_ptr <clock_source> m_clock;
            std::deque <task_t> m_queue;
            std::vector <timer> m_timers;
            uint64_t m_next_sequence = 0;
            mutable std::mutex m_mutex;
    };
}

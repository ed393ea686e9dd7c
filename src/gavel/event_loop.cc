// This is copyrighted software. More information is at the end of this file.
#include <gavel/event_loop.hh>

#include <algorithm>
#include <iterator>
#include <thread>

namespace gavel {
    steady_clock_source::steady_clock_source()
        : m_epoch(std::chrono::steady_clock::now()) {
    }

    clock_source::duration steady_clock_source::now() const {
        return std::chrono::duration_cast <duration>(std::chrono::steady_clock::now() - m_epoch);
    }

    event_loop::event_loop(std::shared_ptr <clock_source> clock)
        : m_clock(clock ? std::move(clock) : std::make_shared <steady_clock_source>()) {
    }

    event_loop::~event_loop() = default;

    const clock_source& event_loop::clock() const {
        return *m_clock;
    }

    double event_loop::now_seconds() const {
        return std::chrono::duration <double>(m_clock->now()).count();
    }

    void event_loop::post(task_t task) {
        if (!task) {
            return;
        }
        std::lock_guard <std::mutex> lk(m_mutex);
        m_queue.emplace_back(std::move(task));
    }

    void event_loop::post_delayed(clock_source::duration delay, task_t task) {
        if (!task) {
            return;
        }
        const auto deadline = m_clock->now() + std::max(delay, clock_source::duration::zero());
        std::lock_guard <std::mutex> lk(m_mutex);
        m_timers.push_back(timer{deadline, m_next_sequence++, std::move(task)});
    }

    size_t event_loop::run_pending() {
        size_t executed = 0;
        for (;;) {
            // 1) snapshot the ready tasks and due timers under lock
            std::vector <task_t> ready; {
                std::lock_guard <std::mutex> lk(m_mutex);
                ready.assign(std::make_move_iterator(m_queue.begin()), std::make_move_iterator(m_queue.end()));
                m_queue.clear();

                const auto now = m_clock->now();
                auto due_end = std::partition(m_timers.begin(), m_timers.end(),
                                              [now](const timer& t) { return t.deadline <= now; });
                std::sort(m_timers.begin(), due_end, [](const timer& a, const timer& b) {
                    return a.deadline != b.deadline ? a.deadline < b.deadline : a.sequence < b.sequence;
                });
                for (auto it = m_timers.begin(); it != due_end; ++it) {
                    ready.emplace_back(std::move(it->task));
                }
                m_timers.erase(m_timers.begin(), due_end);
            }

            if (ready.empty()) {
                return executed;
            }

            // 2) run outside the lock, tasks may post more work
            for (auto& task : ready) {
                task();
                ++executed;
            }
        }
    }

    std::optional <clock_source::duration> event_loop::next_deadline() const {
        std::lock_guard <std::mutex> lk(m_mutex);
        if (m_timers.empty()) {
            return std::nullopt;
        }
        auto it = std::min_element(m_timers.begin(), m_timers.end(), [](const timer& a, const timer& b) {
            return a.deadline < b.deadline;
        });
        return it->deadline;
    }

    bool event_loop::idle() const {
        std::lock_guard <std::mutex> lk(m_mutex);
        return m_queue.empty() && m_timers.empty();
    }

    bool event_loop::run_until(const std::function <bool()>& done, std::chrono::milliseconds timeout) {
        const auto give_up = m_clock->now() + std::chrono::duration_cast <clock_source::duration>(timeout);
        for (;;) {
            run_pending();
            if (done()) {
                return true;
            }
            const auto now = m_clock->now();
            if (now >= give_up) {
                return done();
            }

            // sleep until the next timer, but stay responsive to posts from other threads
            auto wait = std::chrono::duration_cast <clock_source::duration>(std::chrono::milliseconds(5));
            if (auto deadline = next_deadline()) {
                wait = std::min(wait, std::max(*deadline - now, clock_source::duration::zero()));
            }
            std::this_thread::sleep_for(wait);
        }
    }
}

/*
 * Copyright (C) 2025
 *
 * This file is part of gavel.
 *
 * gavel is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * gavel is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with gavel.  If not, see <http://www.gnu.org/licenses/>.
 */

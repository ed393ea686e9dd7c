// This is copyrighted software. More information is at the end of this file.
#include <gavel/software_decoder.hh>
#include <gavel/event_loop.hh>
#include <gavel/error.hh>
#include <failsafe/failsafe.hh>

namespace gavel {
    software_decoder::software_decoder(event_loop& loop,
                                       fetcher& source,
                                       decode_session::decoder_factory_t factory,
                                       std::size_t cache_capacity)
        : m_loop(loop),
          m_fetcher(source),
          m_factory(std::move(factory)),
          m_cache(cache_capacity),
          m_self(std::make_shared <software_decoder*>(this)) {
    }

    software_decoder::~software_decoder() = default;

    void software_decoder::decode(const std::string& uri, completion_t done) {
        if (auto cached = m_cache.find(uri)) {
            LOG_DEBUG("software_decoder", "Cache hit:", uri);
            m_loop.post([done = std::move(done), cached = std::move(cached)]() {
                done(cached, nullptr);
            });
            return;
        }

        auto it = m_waiters.find(uri);
        if (it != m_waiters.end()) {
            // same uri already queued or running, share its result
            it->second.push_back(std::move(done));
            return;
        }

        m_waiters[uri].push_back(std::move(done));
        m_jobs.push_back(uri);
        pump();
    }

    void software_decoder::prepare(ready_callback_t done) {
        with_session(std::move(done));
    }

    bool software_decoder::session_ready() const noexcept {
        return m_session != nullptr;
    }

    const decode_cache& software_decoder::cache() const noexcept {
        return m_cache;
    }

    std::size_t software_decoder::in_flight() const noexcept {
        return m_waiters.size();
    }

    void software_decoder::pump() {
        if (m_busy || m_jobs.empty()) {
            return;
        }
        m_busy = true;
        auto uri = m_jobs.front();
        m_jobs.pop_front();
        run_job(uri);
    }

    void software_decoder::run_job(const std::string& uri) {
        std::weak_ptr <software_decoder*> alive = m_self;
        with_session([alive, uri](std::exception_ptr error) {
            auto self = alive.lock();
            if (!self) {
                return;
            }
            software_decoder* me = *self;
            if (error) {
                me->finish(uri, nullptr, error);
                return;
            }
            // a job may have been served from the cache while waiting in the queue
            if (auto cached = me->m_cache.find(uri)) {
                me->finish(uri, cached, nullptr);
                return;
            }
            me->m_fetcher.fetch(uri, [alive, uri](fetch_response response) {
                if (auto s = alive.lock()) {
                    (*s)->on_fetched(uri, std::move(response));
                }
            });
        });
    }

    void software_decoder::with_session(ready_callback_t next) {
        if (m_session) {
            next(nullptr);
            return;
        }

        std::weak_ptr <software_decoder*> alive = m_self;
        m_loop.post([alive, next = std::move(next)]() {
            auto self = alive.lock();
            if (!self) {
                return;
            }
            software_decoder* me = *self;
            if (!me->m_session) {
                try {
                    me->m_session = std::make_unique <decode_session>(me->m_factory);
                } catch (const std::exception& e) {
                    LOG_ERROR("software_decoder", "Decoder session failed to initialize:", e.what());
                    next(std::current_exception());
                    return;
                }
            }
            next(nullptr);
        });
    }

    void software_decoder::on_fetched(const std::string& uri, fetch_response response) {
        if (!response.ok()) {
            finish(uri, nullptr, std::make_exception_ptr(fetch_error(uri, response.status)));
            return;
        }

        pcm_buffer_ptr buffer;
        std::exception_ptr error;
        try {
            auto audio = m_session->decode(response.body);
            if (audio.frames == 0) {
                throw decode_error("Failed to decode " + uri + ": no samples");
            }
            buffer = std::make_shared <const pcm_buffer>(std::move(audio.channel_data), audio.sample_rate);
            m_cache.insert(uri, buffer);
        } catch (const std::exception&) {
            error = std::current_exception();
        }
        m_session->reset();

        finish(uri, buffer, error);
    }

    void software_decoder::finish(const std::string& uri,
                                  const pcm_buffer_ptr& buffer,
                                  const std::exception_ptr& error) {
        std::vector <completion_t> waiters;
        auto it = m_waiters.find(uri);
        if (it != m_waiters.end()) {
            waiters = std::move(it->second);
            m_waiters.erase(it);
        }
        m_busy = false;

        std::weak_ptr <software_decoder*> alive = m_self;
        for (auto& done : waiters) {
            done(buffer, error);
        }
        if (alive.lock()) {
            pump();
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

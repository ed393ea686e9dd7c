/**
 * @file decode_cache.hh
 * @brief Bounded FIFO cache of decoded buffers keyed by source URI
 * @ingroup sources
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>
#include <gavel/pcm_buffer.hh>
#include <gavel/export_gavel.h>

namespace gavel {
    /**
     * @class decode_cache
     * @brief Insertion-ordered cache with first-in first-out eviction
     *
     * Lookups do not refresh an entry: the oldest inserted key is evicted
     * first regardless of how recently it was read. Entries are immutable
     * once inserted; inserting an existing key is ignored.
     */
    class GAVEL_EXPORT decode_cache {
        public:
            static constexpr std::size_t default_capacity = 100;

            explicit decode_cache(std::size_t capacity = default_capacity);

            /**
             * @return Cached buffer, or nullptr on miss
             */
            [[nodiscard]] pcm_buffer_ptr find(const std::string& uri) const;

            [[nodiscard]] bool contains(const std::string& uri) const;

            /**
             * @brief Insert, evicting the oldest entry first when full
             */
            void insert(const std::string& uri, pcm_buffer_ptr buffer);

            [[nodiscard]] std::size_t size() const noexcept;
            [[nodiscard]] std::size_t capacity() const noexcept;

            void clear();

        private:
            std::size_t m_capacity;
            std::deque <std::string> m_order;
            std::unordered_map <std::string, pcm_buffer_ptr> m_entries;
    };
}

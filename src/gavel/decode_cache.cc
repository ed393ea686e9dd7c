// This is copyrighted software. More information is at the end of this file.
#include <gavel/decode_cache.hh>

namespace gavel {
    decode_cache::decode_cache(std::size_t capacity)
        : m_capacity(capacity == 0 ? 1 : capacity) {
    }

    pcm_buffer_ptr decode_cache::find(const std::string& uri) const {
        auto it = m_entries.find(uri);
        if (it == m_entries.end()) {
            return nullptr;
        }
        return it->second;
    }

    bool decode_cache::contains(const std::string& uri) const {
        return m_entries.find(uri) != m_entries.end();
    }

    void decode_cache::insert(const std::string& uri, pcm_buffer_ptr buffer) {
        if (!buffer || contains(uri)) {
            return;
        }

        while (m_entries.size() >= m_capacity && !m_order.empty()) {
            m_entries.erase(m_order.front());
            m_order.pop_front();
        }

        m_order.push_back(uri);
        m_entries.emplace(uri, std::move(buffer));
    }

    std::size_t decode_cache::size() const noexcept {
        return m_entries.size();
    }

    std::size_t decode_cache::capacity() const noexcept {
        return m_capacity;
    }

    void decode_cache::clear() {
        m_order.clear();
        m_entries.clear();
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

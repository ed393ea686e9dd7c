// This is copyrighted software. More information is at the end of this file.
#include <gavel/sdk/decoder.hh>

#include <memory>

namespace gavel {
    struct decoder::impl final {
        bool m_is_open = false;
    };

    decoder::decoder()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder::~decoder() = default;

    bool decoder::is_open() const {
        return m_pimpl->m_is_open;
    }

    size_t decoder::decode(float buf[], size_t len, bool& call_again) {
        call_again = false;
        if (!is_open() || !buf || len == 0) {
            return 0;
        }

        const auto channels = static_cast <size_t>(get_channels());
        if (channels == 0) {
            return 0;
        }
        // never hand out a partial frame
        len -= len % channels;
        if (len == 0) {
            return 0;
        }
        return do_decode(buf, len, call_again);
    }

    void decoder::close() {
        m_pimpl->m_is_open = false;
    }

    void decoder::set_is_open(bool f) {
        m_pimpl->m_is_open = f;
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

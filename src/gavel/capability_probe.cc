// This is copyrighted software. More information is at the end of this file.
#include <gavel/capability_probe.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>

namespace gavel {
    namespace {
        constexpr const char* probably = "probably";
    }

    static_media_capabilities::static_media_capabilities(std::vector <std::string> probably_types)
        : m_probably(std::move(probably_types)) {
    }

    std::string static_media_capabilities::can_play_type(const std::string& mime) const {
        if (std::find(m_probably.begin(), m_probably.end(), mime) != m_probably.end()) {
            return probably;
        }
        return {};
    }

    capability_probe::capability_probe(std::shared_ptr <const media_capabilities> host)
        : m_host(std::move(host)) {
    }

    bool capability_probe::supports_codec_natively() const {
        if (!m_host) {
            return false;
        }
        return m_host->can_play_type(ogg_opus_mime) == probably
               || m_host->can_play_type(webm_opus_mime) == probably;
    }

    bool capability_probe::needs_software_decoding() {
        if (!m_needs_software) {
            m_needs_software = !supports_codec_natively();
            if (*m_needs_software) {
                LOG_INFO("capability_probe", "Software Opus decoding enabled");
            }
        }
        return *m_needs_software;
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

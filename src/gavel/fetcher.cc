// This is copyrighted software. More information is at the end of this file.
#include <gavel/fetcher.hh>
#include <gavel/event_loop.hh>
#include <gavel/sdk/io_stream.hh>
#include <failsafe/failsafe.hh>

namespace gavel {
    namespace {
        constexpr const char* file_scheme = "file://";

        bool starts_with(const std::string& s, const std::string& prefix) {
            return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
        }
    }

    file_fetcher::file_fetcher(event_loop& loop, std::string asset_root)
        : m_loop(loop),
          m_asset_root(std::move(asset_root)) {
    }

    std::string file_fetcher::resolve(const std::string& uri) const {
        if (starts_with(uri, file_scheme)) {
            return uri.substr(std::char_traits <char>::length(file_scheme));
        }
        if (uri.find("://") != std::string::npos) {
            return {};
        }
        if (uri.empty() || uri.front() == '/' || m_asset_root.empty()) {
            return uri;
        }
        if (m_asset_root.back() == '/') {
            return m_asset_root + uri;
        }
        return m_asset_root + "/" + uri;
    }

    void file_fetcher::fetch(const std::string& uri, completion_t done) {
        fetch_response response;
        const auto path = resolve(uri);
        if (path.empty()) {
            LOG_WARN("file_fetcher", "Unsupported URI scheme:", uri);
            response.status = 400;
        } else if (auto stream = io_from_file(path)) {
            response.body = read_all(stream.get());
            response.status = 200;
        } else {
            response.status = 404;
        }

        m_loop.post([done = std::move(done), response = std::move(response)]() mutable {
            done(std::move(response));
        });
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

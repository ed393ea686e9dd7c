// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace gavel {

/**
 * @brief Base exception class for all gavel errors
 *
 * Every gavel-specific exception derives from this class, so a single
 * catch block covers the whole library.
 */
class gavel_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Transport failure while fetching source bytes
 *
 * Raised by the software decoder when the fetcher reports a non-success
 * status. Surfaced to listeners as an "error" event, never thrown out of
 * playback_handle::play().
 */
class fetch_error : public gavel_error {
public:
    fetch_error(const std::string& uri, int status)
        : gavel_error("Failed to fetch " + uri + ": " + std::to_string(status)),
          m_uri(uri),
          m_status(status) {
    }

    [[nodiscard]] const std::string& uri() const noexcept { return m_uri; }
    [[nodiscard]] int status() const noexcept { return m_status; }

private:
    std::string m_uri;
    int m_status;
};

/**
 * @brief The decode engine produced no usable frames
 *
 * Also thrown by decoders when the data is not in their format.
 */
class decode_error : public gavel_error {
public:
    using gavel_error::gavel_error;
};

/**
 * @brief Playback was requested before a successful load
 *
 * Used for the log message only: a missing buffer turns into an "error"
 * event and a silent no-op, it is never thrown to the caller.
 */
class missing_buffer_error : public gavel_error {
public:
    using gavel_error::gavel_error;
};

/**
 * @brief I/O stream related errors
 */
class io_error : public gavel_error {
public:
    using gavel_error::gavel_error;
};

/**
 * @brief Output device related errors
 *
 * Thrown when the backend cannot be initialized or the device cannot be
 * opened.
 */
class device_error : public gavel_error {
public:
    using gavel_error::gavel_error;
};

/**
 * @brief Operation attempted in an invalid state
 *
 * For example rendering through an output context that was never opened.
 */
class state_error : public gavel_error {
public:
    using gavel_error::gavel_error;
};

/**
 * @brief Message of a captured exception, for logging
 */
inline std::string describe_error(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace gavel

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

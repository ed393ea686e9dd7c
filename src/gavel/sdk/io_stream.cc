// This is copyrighted software. More information is at the end of this file.
#include <gavel/sdk/io_stream.hh>
#include <algorithm>
#include <cstring>
#include <fstream>

namespace gavel {

class memory_stream : public io_stream {
public:
    memory_stream(const void* data, size_t size_bytes)
        : m_data(static_cast<const uint8_t*>(data))
        , m_size(size_bytes)
        , m_position(0)
        , m_is_open(true) {}

    size_t read(void* ptr, size_t size_bytes) override {
        if (!m_is_open || m_position >= m_size) {
            return 0;
        }

        size_t to_read = std::min(size_bytes, m_size - m_position);
        std::memcpy(ptr, m_data + m_position, to_read);
        m_position += to_read;
        return to_read;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        if (!m_is_open) {
            return -1;
        }

        int64_t new_pos = 0;
        switch (whence) {
            case seek_origin::set:
                new_pos = offset;
                break;
            case seek_origin::cur:
                new_pos = static_cast<int64_t>(m_position) + offset;
                break;
            case seek_origin::end:
                new_pos = static_cast<int64_t>(m_size) + offset;
                break;
        }

        if (new_pos < 0 || new_pos > static_cast<int64_t>(m_size)) {
            return -1;
        }

        m_position = static_cast<size_t>(new_pos);
        return new_pos;
    }

    int64_t tell() override {
        return m_is_open ? static_cast<int64_t>(m_position) : -1;
    }

    int64_t get_size() override {
        return m_is_open ? static_cast<int64_t>(m_size) : -1;
    }

    void close() override {
        m_is_open = false;
    }

    bool is_open() const override {
        return m_is_open;
    }

private:
    const uint8_t* m_data;
    size_t m_size;
    size_t m_position;
    bool m_is_open;
};

class file_stream : public io_stream {
public:
    explicit file_stream(const std::string& filename) {
        m_file.open(filename, std::ios::binary | std::ios::in);
    }

    size_t read(void* ptr, size_t size_bytes) override {
        if (!is_open()) {
            return 0;
        }
        m_file.read(static_cast<char*>(ptr), static_cast<std::streamsize>(size_bytes));
        return static_cast<size_t>(m_file.gcount());
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        if (!is_open()) {
            return -1;
        }

        std::ios::seekdir dir = std::ios::beg;
        switch (whence) {
            case seek_origin::set: dir = std::ios::beg; break;
            case seek_origin::cur: dir = std::ios::cur; break;
            case seek_origin::end: dir = std::ios::end; break;
        }

        // a short read leaves eofbit set, which would make seekg fail
        m_file.clear();
        m_file.seekg(offset, dir);
        return tell();
    }

    int64_t tell() override {
        if (!is_open()) {
            return -1;
        }
        return static_cast<int64_t>(m_file.tellg());
    }

    int64_t get_size() override {
        if (!is_open()) {
            return -1;
        }
        m_file.clear();
        auto cur_pos = m_file.tellg();
        m_file.seekg(0, std::ios::end);
        auto file_size = m_file.tellg();
        m_file.seekg(cur_pos);
        return static_cast<int64_t>(file_size);
    }

    void close() override {
        m_file.close();
    }

    bool is_open() const override {
        return m_file.is_open();
    }

private:
    mutable std::ifstream m_file;
};

std::unique_ptr<io_stream> io_from_file(const std::string& filename) {
    auto stream = std::make_unique<file_stream>(filename);
    if (!stream->is_open()) {
        return nullptr;
    }
    return stream;
}

std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes) {
    return std::make_unique<memory_stream>(mem, size_bytes);
}

std::vector<uint8_t> read_all(io_stream* stream) {
    std::vector<uint8_t> out;
    if (!stream || !stream->is_open()) {
        return out;
    }

    const auto size = stream->get_size();
    const auto pos = stream->tell();
    if (size > 0 && pos >= 0 && size >= pos) {
        out.reserve(static_cast<size_t>(size - pos));
    }

    uint8_t chunk[4096];
    for (;;) {
        const auto got = stream->read(chunk, sizeof(chunk));
        if (got == 0) {
            break;
        }
        out.insert(out.end(), chunk, chunk + got);
    }
    return out;
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

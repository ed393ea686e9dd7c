/**
 * @file buffer.hh
 * @brief Fixed-size scratch buffer for the render and decode paths
 * @ingroup sdk
 */

#pragma once

#include <algorithm>
#include <cstring>
#include <memory>
#include <type_traits>

namespace gavel {
    /**
     * @class buffer
     * @brief Zero-initialized array of trivially copyable elements
     * @tparam T Element type
     * @ingroup sdk
     *
     * Used where a std::vector would hide reallocations: the mixer scratch
     * area inside the audio callback, and the interleaved chunk buffer of
     * the decode session. The size only changes through reset() or grow().
     *
     * @code
     * buffer<float> mix(1024);
     * std::fill(mix.begin(), mix.end(), 0.f);
     * @endcode
     */
    template<typename T>
    class buffer final {
        static_assert(std::is_trivially_copyable_v<T>, "buffer<T> requires trivially copyable T");
    public:
        explicit buffer(std::size_t size)
            : m_data(std::make_unique<T[]>(size)), m_size(size) {
            std::fill_n(m_data.get(), m_size, T{});
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return m_size;
        }

        T* data() noexcept { return m_data.get(); }
        const T* data() const noexcept { return m_data.get(); }

        /**
         * @brief Drop the contents and allocate @p new_size zeroed elements
         */
        void reset(std::size_t new_size) {
            m_data = std::make_unique<T[]>(new_size);
            m_size = new_size;
            std::fill_n(m_data.get(), m_size, T{});
        }

        /**
         * @brief Make room for at least @p min_size elements, keeping the contents
         *
         * Never shrinks. Called outside the audio thread's steady state, so the
         * reallocation only happens when the device asks for a larger period.
         */
        void grow(std::size_t min_size) {
            if (min_size <= m_size) {
                return;
            }
            auto new_data = std::make_unique<T[]>(min_size);
            std::memcpy(new_data.get(), m_data.get(), sizeof(T) * m_size);
            std::fill(new_data.get() + m_size, new_data.get() + min_size, T{});
            m_data.swap(new_data);
            m_size = min_size;
        }

        T& operator[](std::size_t pos) noexcept { return m_data[pos]; }
        const T& operator[](std::size_t pos) const noexcept { return m_data[pos]; }

        T* begin() noexcept { return data(); }
        T* end() noexcept { return data() + size(); }
        const T* begin() const noexcept { return data(); }
        const T* end() const noexcept { return data() + size(); }

    private:
        std::unique_ptr<T[]> m_data;
        std::size_t m_size;
    };
}

/**
 * @file decoder.hh
 * @brief Base class for compressed audio decoders
 * @ingroup decoder_interface
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <gavel/sdk/io_stream.hh>
#include <gavel/sdk/export_gavel_sdk.h>
#include <gavel/sdk/types.hh>
#include <chrono>
#include <memory>

namespace gavel {
    /**
     * @class decoder
     * @brief Abstract base class for audio format decoders
     * @ingroup decoder_interface
     *
     * A decoder reads encoded audio from an io_stream and produces
     * interleaved floating-point PCM. The decode session keeps one decoder
     * alive for the whole process and reopens it for every file, so
     * implementations must support open() -> decode()* -> close() cycles
     * on the same instance.
     *
     * @code
     * class my_decoder : public decoder {
     * public:
     *     const char* get_name() const override { return "My Format"; }
     *
     *     void open(io_stream* stream) override {
     *         parse_header(stream);
     *         set_is_open(true);
     *     }
     *     // ...
     * protected:
     *     size_t do_decode(float* buf, size_t len, bool& call_again) override {
     *         // fill buf, set call_again = !reached_end
     *     }
     * };
     * @endcode
     *
     * ## Decoder Lifecycle
     *
     * 1. Construction
     * 2. open() - parse the stream, query get_channels() / get_rate()
     * 3. decode() - repeatedly until call_again is false
     * 4. close() - release per-file state; the instance can be opened again
     *
     * @see decode_session, decoder_opus
     */
    class GAVEL_SDK_EXPORT decoder {
        public:
            decoder();
            virtual ~decoder();

            decoder(const decoder&) = delete;
            decoder& operator=(const decoder&) = delete;

            /**
             * @brief Check if decoder is open and ready
             */
            [[nodiscard]] bool is_open() const;

            /**
             * @brief Decode interleaved float samples
             *
             * @param[out] buf Buffer to fill
             * @param len Buffer size in samples (not frames)
             * @param[out] call_again Set to true if more data is available
             * @return Number of samples written, always a multiple of get_channels()
             */
            [[nodiscard]] size_t decode(float buf[], size_t len, bool& call_again);

            /**
             * @brief Human-readable decoder name
             */
            [[nodiscard]] virtual const char* get_name() const = 0;

            /**
             * @brief Parse the stream header and prepare for decoding
             *
             * @param rwops Stream containing the encoded file
             * @throws decode_error if the data is not in this decoder's format
             *
             * @note The decoder does not take ownership of the stream, but may
             *       keep reading from it until close()
             */
            virtual void open(io_stream* rwops) = 0;

            /**
             * @brief Release per-file state
             *
             * After close() the decoder is back in its freshly constructed
             * state. The default implementation only clears the open flag.
             */
            virtual void close();

            /**
             * @pre Decoder must be open
             */
            [[nodiscard]] virtual channels_t get_channels() const = 0;

            /**
             * @pre Decoder must be open
             */
            [[nodiscard]] virtual sample_rate_t get_rate() const = 0;

            /**
             * @brief Rewind to the first sample
             * @return false if not seekable
             */
            virtual bool rewind() = 0;

            /**
             * @brief Total duration, zero if unknown
             */
            [[nodiscard]] virtual std::chrono::microseconds duration() const = 0;

        protected:
            /**
             * @brief Call from open() after successful initialization
             */
            void set_is_open(bool f);

            /**
             * @brief Implementation-specific decode
             *
             * @note Samples should be in range [-1.0, 1.0]
             */
            virtual size_t do_decode(float* buf, size_t len, bool& call_again) = 0;

        private:
            struct impl;
            const std::unique_ptr <impl> m_pimpl;
    };
}

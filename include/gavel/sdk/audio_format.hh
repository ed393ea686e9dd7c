/**
 * @file audio_format.hh
 * @brief Output sample formats and device specification
 * @ingroup sdk_audio_format
 */

#ifndef GAVEL_SDK_AUDIO_FORMAT_H
#define GAVEL_SDK_AUDIO_FORMAT_H

#include <gavel/sdk/types.hh>
#include <gavel/sdk/export_gavel_sdk.h>
#include <iosfwd>

namespace gavel {

/**
 * @enum audio_format
 * @brief Sample formats the output context can render into
 *
 * The low byte holds the bit size, bit 15 the signedness and bit 8 marks
 * floating point, so the helpers below need no lookup table.
 */
enum class audio_format : uint16_t {
    unknown = 0,
    s16le = 0x8010,      ///< Signed 16-bit little-endian
    f32le = 0x8120       ///< Float 32-bit little-endian
};

inline constexpr uint8_t audio_format_byte_size(audio_format fmt) {
    return static_cast<uint8_t>((static_cast<uint16_t>(fmt) & 0xFF) / 8);
}

inline constexpr bool audio_format_is_float(audio_format fmt) {
    return (static_cast<uint16_t>(fmt) & 0x0100) != 0;
}

/**
 * @struct audio_spec
 * @brief Requested or obtained device format
 */
struct audio_spec {
    audio_format format;  ///< Sample format
    channels_t channels;  ///< Number of channels (1=mono, 2=stereo)
    sample_rate_t freq;   ///< Sample rate in Hz
};

GAVEL_SDK_EXPORT std::ostream& operator<<(std::ostream& os, audio_format fmt);

} // namespace gavel

#endif // GAVEL_SDK_AUDIO_FORMAT_H

/**
 * @file types.hh
 * @brief Platform-independent type definitions
 * @ingroup sdk_types
 */

#ifndef GAVEL_SDK_TYPES_H
#define GAVEL_SDK_TYPES_H

#include <cstdint>
#include <cstddef>

namespace gavel {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk
 * @brief Core type definitions for audio processing
 * @{
 */

/**
 * @brief Sample rate in Hz (48000 for Opus, 44100 for CD audio)
 */
using sample_rate_t = uint32_t;

/**
 * @brief Number of interleaved audio channels
 */
using channels_t = uint8_t;

/**
 * @brief Number of sample frames (one sample per channel)
 */
using frames_t = uint64_t;

/** @} */ // end of sdk_types group

} // namespace gavel

#endif // GAVEL_SDK_TYPES_H

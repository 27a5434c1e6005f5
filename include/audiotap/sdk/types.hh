/**
 * @file types.hh
 * @brief Platform-independent type definitions
 * @ingroup sdk_types
 */

#ifndef AUDIOTAP_SDK_TYPES_HH
#define AUDIOTAP_SDK_TYPES_HH

#include <cstdint>
#include <cstddef>

namespace audiotap {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk
 * @brief Core type definitions for audio capture
 *
 * @code
 * sample_rate_t rate = 48000;  // device native rate
 * channels_t channels = 2;      // stereo loopback
 * @endcode
 *
 * @{
 */

/**
 * @typedef sample_rate_t
 * @brief Type for audio sample rates
 *
 * Number of audio frames per second (Hz). Capture devices typically run
 * at 44100 or 48000 Hz; the pipeline output runs at 16000 Hz.
 */
using sample_rate_t = uint32_t;

/**
 * @typedef channels_t
 * @brief Type for audio channel count
 *
 * Range: 1 to 255 channels (uint8_t max)
 */
using channels_t = uint8_t;

/** @} */ // end of sdk_types group

} // namespace audiotap

#endif // AUDIOTAP_SDK_TYPES_HH

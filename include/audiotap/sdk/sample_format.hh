/**
 * @file sample_format.hh
 * @brief Device sample encodings and their conversion to float
 * @ingroup sdk_sample_format
 */

#ifndef AUDIOTAP_SDK_SAMPLE_FORMAT_HH
#define AUDIOTAP_SDK_SAMPLE_FORMAT_HH

#include <audiotap/sdk/types.hh>
#include <audiotap/sdk/export_audiotap_sdk.h>
#include <iosfwd>

namespace audiotap {

/**
 * @enum sample_encoding
 * @brief Sample encodings a capture device may deliver
 *
 * All encodings are in the host byte order. Anything the device reports
 * outside this list is rejected when the stream is constructed.
 */
enum class sample_encoding : uint8_t {
    unknown = 0,   ///< Unsupported or not yet negotiated
    s16,           ///< Signed 16-bit integer
    u16,           ///< Unsigned 16-bit integer, 32768 is silence
    f32            ///< 32-bit float in [-1.0, 1.0]
};

/**
 * @struct stream_format
 * @brief Native format of a capture device
 */
struct stream_format {
    sample_rate_t rate = 0;
    channels_t channels = 0;
    sample_encoding encoding = sample_encoding::unknown;
};

AUDIOTAP_SDK_EXPORT const char* to_string(sample_encoding enc);
AUDIOTAP_SDK_EXPORT std::ostream& operator<<(std::ostream& os, sample_encoding enc);
AUDIOTAP_SDK_EXPORT std::ostream& operator<<(std::ostream& os, const stream_format& fmt);

/**
 * @brief Size of one sample of the given encoding
 * @return 2 or 4, 0 for unknown
 */
AUDIOTAP_SDK_EXPORT std::size_t bytes_per_sample(sample_encoding enc);

/**
 * @brief Size of one interleaved frame
 */
inline std::size_t bytes_per_frame(const stream_format& fmt) {
    return bytes_per_sample(fmt.encoding) * fmt.channels;
}

/**
 * Converts @p samples raw samples from @p buff into normalized floats.
 */
using to_float_converter_func_t = void (*)(float dst[], const uint8_t* buff, std::size_t samples);

/**
 * @brief Resolve the converter for an encoding
 *
 * Called once per stream so the per-sample path has no dispatch.
 *
 * @throws format_error for sample_encoding::unknown
 */
AUDIOTAP_SDK_EXPORT to_float_converter_func_t get_to_float_converter(sample_encoding enc);

} // namespace audiotap

#endif // AUDIOTAP_SDK_SAMPLE_FORMAT_HH

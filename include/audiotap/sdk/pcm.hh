//
// Float to 16-bit PCM encoding
//

#ifndef AUDIOTAP_SDK_PCM_HH
#define AUDIOTAP_SDK_PCM_HH

#include <audiotap/sdk/types.hh>
#include <audiotap/sdk/export_audiotap_sdk.h>

namespace audiotap {
    /**
     * @brief Encode a float sample as signed 16-bit PCM
     *
     * The sample is clamped to [-1.0, 1.0] before scaling by 32767, so the
     * result is always in [-32767, 32767]. NaN encodes as silence.
     */
    inline int16_t float_to_s16(float f) noexcept {
        if (f != f) {
            return 0;
        }
        const float clamped = (f >= 1.f) ? 1.f : (f < -1.f ? -1.f : f);
        return static_cast<int16_t>(clamped * 32767.0f);
    }

    AUDIOTAP_SDK_EXPORT void float_to_s16(int16_t dst[], const float src[], std::size_t samples) noexcept;
}

#endif

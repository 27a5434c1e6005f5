//
// Channel reduction for the capture path
//

#ifndef AUDIOTAP_SDK_DOWNMIX_HH
#define AUDIOTAP_SDK_DOWNMIX_HH

#include <audiotap/sdk/types.hh>
#include <audiotap/sdk/export_audiotap_sdk.h>

namespace audiotap {
    /**
     * @brief Average one interleaved frame to a mono sample
     * @param frame Pointer to @p channels samples
     * @param channels Number of channels, at least 1
     */
    inline float downmix_frame(const float* frame, channels_t channels) noexcept {
        float sum = 0.0f;
        for (channels_t c = 0; c < channels; c++) {
            sum += frame[c];
        }
        return sum / static_cast<float>(channels);
    }

    /**
     * @brief Downmix @p frames interleaved frames into @p dst
     *
     * @p dst may alias @p src: frame i is read before sample i is written.
     */
    AUDIOTAP_SDK_EXPORT void downmix(float dst[], const float src[], std::size_t frames, channels_t channels) noexcept;
}

#endif

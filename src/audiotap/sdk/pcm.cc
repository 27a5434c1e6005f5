#include <audiotap/sdk/pcm.hh>

namespace audiotap {
    void float_to_s16(int16_t dst[], const float src[], std::size_t samples) noexcept {
        for (std::size_t i = 0; i < samples; ++i) {
            dst[i] = float_to_s16(src[i]);
        }
    }
}

#include <audiotap/sdk/downmix.hh>
#include <algorithm>

namespace audiotap {
    void downmix(float dst[], const float src[], std::size_t frames, channels_t channels) noexcept {
        if (channels == 1) {
            if (dst != src) {
                std::copy_n(src, frames, dst);
            }
            return;
        }
        for (std::size_t i = 0; i < frames; i++) {
            dst[i] = downmix_frame(src + i * channels, channels);
        }
    }
}

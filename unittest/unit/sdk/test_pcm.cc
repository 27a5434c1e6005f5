#include <doctest/doctest.h>
#include <audiotap/sdk/pcm.hh>
#include <limits>
#include <vector>

using namespace audiotap;

TEST_SUITE("SDK::PCM") {

    TEST_CASE("should_scale_full_range_symmetrically") {
        CHECK(float_to_s16(1.0f) == 32767);
        CHECK(float_to_s16(-1.0f) == -32767);
        CHECK(float_to_s16(0.0f) == 0);
        CHECK(float_to_s16(0.5f) == 16383);
        CHECK(float_to_s16(-0.5f) == -16383);
    }

    TEST_CASE("should_clamp_without_wraparound") {
        CHECK(float_to_s16(1.5f) == 32767);
        CHECK(float_to_s16(100.0f) == 32767);
        CHECK(float_to_s16(-1.5f) == -32767);
        CHECK(float_to_s16(-100.0f) == -32767);
        CHECK(float_to_s16(std::numeric_limits<float>::infinity()) == 32767);
        CHECK(float_to_s16(-std::numeric_limits<float>::infinity()) == -32767);
    }

    TEST_CASE("should_map_nan_to_silence") {
        CHECK(float_to_s16(std::numeric_limits<float>::quiet_NaN()) == 0);
    }

    TEST_CASE("should_convert_buffers") {
        const std::vector<float> src = {0.0f, 1.0f, -1.0f, 2.0f, -2.0f, 0.25f};
        std::vector<int16_t> dst(src.size());
        float_to_s16(dst.data(), src.data(), src.size());
        CHECK(dst[0] == 0);
        CHECK(dst[1] == 32767);
        CHECK(dst[2] == -32767);
        CHECK(dst[3] == 32767);
        CHECK(dst[4] == -32767);
        CHECK(dst[5] == 8191);
    }
}

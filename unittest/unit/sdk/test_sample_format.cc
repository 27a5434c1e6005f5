#include <doctest/doctest.h>
#include <audiotap/sdk/sample_format.hh>
#include <audiotap/error.hh>
#include <cstring>
#include <sstream>
#include <vector>

using namespace audiotap;

namespace {
    template<typename T>
    std::vector<uint8_t> as_bytes(const std::vector<T>& v) {
        std::vector<uint8_t> out(v.size() * sizeof(T));
        std::memcpy(out.data(), v.data(), out.size());
        return out;
    }
}

TEST_SUITE("SDK::SampleFormat") {

    TEST_CASE("should_report_sample_sizes") {
        CHECK(bytes_per_sample(sample_encoding::s16) == 2);
        CHECK(bytes_per_sample(sample_encoding::u16) == 2);
        CHECK(bytes_per_sample(sample_encoding::f32) == 4);
        CHECK(bytes_per_sample(sample_encoding::unknown) == 0);

        stream_format fmt{48000, 2, sample_encoding::f32};
        CHECK(bytes_per_frame(fmt) == 8);
    }

    TEST_CASE("should_normalize_s16") {
        const auto bytes = as_bytes(std::vector<int16_t>{0, 16384, -32768, 32767});
        float out[4] = {};
        get_to_float_converter(sample_encoding::s16)(out, bytes.data(), 4);
        CHECK(out[0] == 0.0f);
        CHECK(out[1] == doctest::Approx(0.5f));
        CHECK(out[2] == -1.0f);
        CHECK(out[3] == doctest::Approx(32767.0f / 32768.0f));
    }

    TEST_CASE("should_normalize_u16") {
        const auto bytes = as_bytes(std::vector<uint16_t>{32768, 0, 49152, 65535});
        float out[4] = {};
        get_to_float_converter(sample_encoding::u16)(out, bytes.data(), 4);
        CHECK(out[0] == 0.0f);
        CHECK(out[1] == -1.0f);
        CHECK(out[2] == doctest::Approx(0.5f));
        CHECK(out[3] == doctest::Approx(32767.0f / 32768.0f));
    }

    TEST_CASE("should_pass_f32_through") {
        const std::vector<float> in = {0.25f, -0.75f, 1.5f};
        const auto bytes = as_bytes(in);
        float out[3] = {};
        get_to_float_converter(sample_encoding::f32)(out, bytes.data(), 3);
        CHECK(out[0] == 0.25f);
        CHECK(out[1] == -0.75f);
        CHECK(out[2] == 1.5f);
    }

    TEST_CASE("should_handle_unaligned_input") {
        std::vector<uint8_t> raw(1 + 2 * sizeof(int16_t));
        const int16_t v[2] = {-16384, 8192};
        std::memcpy(raw.data() + 1, v, sizeof(v));
        float out[2] = {};
        get_to_float_converter(sample_encoding::s16)(out, raw.data() + 1, 2);
        CHECK(out[0] == doctest::Approx(-0.5f));
        CHECK(out[1] == doctest::Approx(0.25f));
    }

    TEST_CASE("should_reject_unknown_encoding") {
        CHECK_THROWS_AS(get_to_float_converter(sample_encoding::unknown), format_error);
    }

    TEST_CASE("should_format_for_logging") {
        std::ostringstream os;
        os << stream_format{44100, 1, sample_encoding::s16};
        CHECK(os.str() == "stream_format{rate=44100, channels=1, encoding=s16}");
        CHECK(std::string(to_string(sample_encoding::f32)) == "f32");
    }
}

//
// Device sample decoding
//

#include <audiotap/sdk/sample_format.hh>
#include <audiotap/error.hh>
#include <cstring>
#include <ostream>
#include <string>

namespace audiotap {

    static void as_float_s16(float out[], const uint8_t* buff, std::size_t samples) {
        for (std::size_t i = 0; i < samples; i++) {
            int16_t v;
            std::memcpy(&v, buff + i * sizeof(v), sizeof(v));
            out[i] = static_cast<float>(v) / 32768.0f;
        }
    }

    static void as_float_u16(float out[], const uint8_t* buff, std::size_t samples) {
        for (std::size_t i = 0; i < samples; i++) {
            uint16_t v;
            std::memcpy(&v, buff + i * sizeof(v), sizeof(v));
            out[i] = (static_cast<float>(v) - 32768.0f) / 32768.0f;
        }
    }

    static void as_float_f32(float out[], const uint8_t* buff, std::size_t samples) {
        std::memcpy(out, buff, samples * sizeof(float));
    }

    const char* to_string(sample_encoding enc) {
        switch (enc) {
            case sample_encoding::s16: return "s16";
            case sample_encoding::u16: return "u16";
            case sample_encoding::f32: return "f32";
            default: return "unknown";
        }
    }

    std::ostream& operator<<(std::ostream& os, sample_encoding enc) {
        return os << to_string(enc);
    }

    std::ostream& operator<<(std::ostream& os, const stream_format& fmt) {
        os << "stream_format{"
           << "rate=" << fmt.rate << ", "
           << "channels=" << static_cast<int>(fmt.channels) << ", "
           << "encoding=" << fmt.encoding
           << "}";
        return os;
    }

    std::size_t bytes_per_sample(sample_encoding enc) {
        switch (enc) {
            case sample_encoding::s16:
            case sample_encoding::u16:
                return 2;
            case sample_encoding::f32:
                return 4;
            default:
                return 0;
        }
    }

    to_float_converter_func_t get_to_float_converter(sample_encoding enc) {
        switch (enc) {
            case sample_encoding::s16: return as_float_s16;
            case sample_encoding::u16: return as_float_u16;
            case sample_encoding::f32: return as_float_f32;
            default:
                throw format_error(std::string("Unsupported sample encoding: ") + to_string(enc));
        }
    }
}

#ifndef AUDIOTAP_BENCHMARK_HELPERS_HH
#define AUDIOTAP_BENCHMARK_HELPERS_HH

#include <audiotap/sdk/output_sink.hh>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <vector>

namespace audiotap::benchmark {

// Sink that only touches the data
class null_sink : public output_sink {
public:
    uint64_t samples = 0;
    int64_t checksum = 0;

    void on_chunk(const int16_t* data, std::size_t count) override {
        samples += count;
        checksum += data[count / 2];
    }
};

// Interleaved s16 sine as raw device bytes
inline std::vector<uint8_t> make_device_bytes_s16(std::size_t frames, unsigned channels, float rate) {
    std::vector<int16_t> pcm(frames * channels);
    for (std::size_t i = 0; i < frames; i++) {
        const auto v = static_cast<int16_t>(16000.0f * std::sin(2.0f * 3.14159265f * 440.0f * static_cast<float>(i) / rate));
        for (unsigned c = 0; c < channels; c++) {
            pcm[i * channels + c] = v;
        }
    }
    std::vector<uint8_t> bytes(pcm.size() * sizeof(int16_t));
    std::memcpy(bytes.data(), pcm.data(), bytes.size());
    return bytes;
}

inline std::vector<float> make_float_block(std::size_t n) {
    std::vector<float> v(n);
    for (std::size_t i = 0; i < n; i++) {
        v[i] = 0.5f * std::sin(static_cast<float>(i) * 0.05f);
    }
    return v;
}

} // namespace audiotap::benchmark

#endif // AUDIOTAP_BENCHMARK_HELPERS_HH

#ifndef AUDIOTAP_MOCK_COMPONENTS_HH
#define AUDIOTAP_MOCK_COMPONENTS_HH

#include <audiotap/sdk/output_sink.hh>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <vector>

namespace audiotap::test {

    // Records every chunk it receives
    class collecting_sink : public output_sink {
        private:
            mutable std::mutex m_mutex;
            std::vector<int16_t> m_samples;
            std::vector<std::size_t> m_chunk_sizes;

        public:
            std::atomic<int> failed_calls{0};

            void on_chunk(const int16_t* samples, std::size_t count) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_samples.insert(m_samples.end(), samples, samples + count);
                m_chunk_sizes.push_back(count);
            }

            void on_stream_failed() override {
                failed_calls++;
            }

            std::vector<int16_t> samples() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_samples;
            }

            std::vector<std::size_t> chunk_sizes() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_chunk_sizes;
            }

            std::size_t total_samples() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_samples.size();
            }
    };

    // Interleaved sine, identical on every channel
    inline std::vector<float> make_sine_f32(std::size_t frames, unsigned channels,
                                            float freq, float rate, float amplitude = 1.0f) {
        std::vector<float> out(frames * channels);
        for (std::size_t i = 0; i < frames; i++) {
            const auto v = amplitude * std::sin(2.0f * 3.14159265f * freq * static_cast<float>(i) / rate);
            for (unsigned c = 0; c < channels; c++) {
                out[i * channels + c] = v;
            }
        }
        return out;
    }

    inline std::vector<int16_t> make_sine_s16(std::size_t frames, unsigned channels,
                                              float freq, float rate, float amplitude = 1.0f) {
        const auto f = make_sine_f32(frames, channels, freq, rate, amplitude);
        std::vector<int16_t> out(f.size());
        for (std::size_t i = 0; i < f.size(); i++) {
            out[i] = static_cast<int16_t>(f[i] * 32767.0f);
        }
        return out;
    }

    // Interleaved square wave with the given peak, identical on every channel
    inline std::vector<float> make_square_f32(std::size_t frames, unsigned channels,
                                              std::size_t period, float peak) {
        std::vector<float> out(frames * channels);
        for (std::size_t i = 0; i < frames; i++) {
            const float v = ((i / (period / 2)) % 2 == 0) ? peak : -peak;
            for (unsigned c = 0; c < channels; c++) {
                out[i * channels + c] = v;
            }
        }
        return out;
    }

    // Feed `frames` frames from `data` in irregular piece sizes
    template<typename Stream, typename T>
    void deliver_irregular(Stream& stream, const std::vector<T>& data, unsigned channels) {
        static const std::size_t pieces[] = {441, 480, 1000, 17, 2048, 256, 733};
        const std::size_t frames = data.size() / channels;
        std::size_t offset = 0;
        std::size_t i = 0;
        while (offset < frames) {
            const auto n = std::min(pieces[i++ % 7], frames - offset);
            stream.deliver(data.data() + offset * channels, n * channels * sizeof(T));
            offset += n;
        }
    }

} // namespace audiotap::test

#endif // AUDIOTAP_MOCK_COMPONENTS_HH

#include <audiotap/wav_writer.hh>
#include <audiotap/error.hh>
#include <audiotap/sdk/endian.hh>
#include <failsafe/failsafe.hh>

#include <cstring>
#include <limits>

namespace audiotap {
    namespace {
        constexpr uint16_t WAVE_FORMAT_PCM = 1;
        constexpr uint16_t BITS_PER_SAMPLE = 16;
        constexpr uint64_t MAX_DATA_BYTES = std::numeric_limits<uint32_t>::max() - (WAV_HEADER_SIZE - 8);

        void put_tag(uint8_t* dst, const char* tag) {
            std::memcpy(dst, tag, 4);
        }

        void put_u16(uint8_t* dst, uint16_t v) {
            v = swap16le(v);
            std::memcpy(dst, &v, sizeof(v));
        }

        void put_u32(uint8_t* dst, uint32_t v) {
            v = swap32le(v);
            std::memcpy(dst, &v, sizeof(v));
        }

        // Little endian samples
        void put_samples(uint8_t* dst, const int16_t* samples, std::size_t count) {
            if constexpr (is_little_endian) {
                std::memcpy(dst, samples, count * sizeof(int16_t));
            } else {
                for (std::size_t i = 0; i < count; i++) {
                    put_u16(dst + i * 2, static_cast<uint16_t>(samples[i]));
                }
            }
        }
    }

    std::vector<uint8_t> make_wav_header(sample_rate_t rate, channels_t channels, uint32_t data_bytes) {
        const uint16_t block_align = static_cast<uint16_t>(channels * (BITS_PER_SAMPLE / 8));

        std::vector<uint8_t> h(WAV_HEADER_SIZE, 0);
        put_tag(&h[0], "RIFF");
        put_u32(&h[4], 36 + data_bytes);
        put_tag(&h[8], "WAVE");
        put_tag(&h[12], "fmt ");
        put_u32(&h[16], 16);
        put_u16(&h[20], WAVE_FORMAT_PCM);
        put_u16(&h[22], channels);
        put_u32(&h[24], rate);
        put_u32(&h[28], rate * block_align);
        put_u16(&h[32], block_align);
        put_u16(&h[34], BITS_PER_SAMPLE);
        put_tag(&h[36], "data");
        put_u32(&h[40], data_bytes);
        return h;
    }

    std::vector<uint8_t> encode_wav(const int16_t* samples, std::size_t count,
                                    sample_rate_t rate, channels_t channels) {
        const auto data_bytes = static_cast<uint64_t>(count) * sizeof(int16_t);
        if (data_bytes > MAX_DATA_BYTES) {
            throw io_error("WAV data exceeds 4 GiB");
        }
        auto out = make_wav_header(rate, channels, static_cast<uint32_t>(data_bytes));
        out.resize(WAV_HEADER_SIZE + data_bytes);
        if (count > 0) {
            put_samples(out.data() + WAV_HEADER_SIZE, samples, count);
        }
        return out;
    }

    wav_writer::wav_writer(const std::string& path, sample_rate_t rate, channels_t channels)
        : m_path(path),
          m_rate(rate),
          m_channels(channels) {
        if (rate == 0 || channels == 0) {
            throw config_error("WAV output needs a positive rate and channel count");
        }
        m_file.open(path, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!m_file.is_open()) {
            throw io_error("Cannot create " + path);
        }
        const auto header = make_wav_header(m_rate, m_channels, 0);
        m_file.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
        if (!m_file.good()) {
            throw io_error("Cannot write WAV header to " + path);
        }
        LOG_DEBUG("wav_writer", "Writing", path, "at", m_rate, "Hz");
    }

    wav_writer::~wav_writer() {
        if (!m_file.is_open()) {
            return;
        }
        try {
            close();
        } catch (const io_error& e) {
            LOG_ERROR("wav_writer", "Failed to finalize", m_path, ":", e.what());
        }
    }

    void wav_writer::write(const int16_t* samples, std::size_t count) {
        if (!m_file.is_open()) {
            throw io_error("WAV file " + m_path + " is closed");
        }
        if (count == 0) {
            return;
        }
        const auto total_bytes = (m_samples + count) * sizeof(int16_t);
        if (total_bytes > MAX_DATA_BYTES) {
            throw io_error("WAV file " + m_path + " would exceed 4 GiB");
        }

        if constexpr (is_little_endian) {
            m_file.write(reinterpret_cast<const char*>(samples),
                         static_cast<std::streamsize>(count * sizeof(int16_t)));
        } else {
            std::vector<uint8_t> bytes(count * sizeof(int16_t));
            put_samples(bytes.data(), samples, count);
            m_file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        }
        if (!m_file.good()) {
            throw io_error("Write to " + m_path + " failed");
        }
        m_samples += count;
    }

    void wav_writer::close() {
        if (!m_file.is_open()) {
            return;
        }
        const auto data_bytes = static_cast<uint32_t>(m_samples * sizeof(int16_t));
        const auto header = make_wav_header(m_rate, m_channels, data_bytes);
        m_file.seekp(0);
        m_file.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
        const bool ok = m_file.good();
        m_file.close();
        if (!ok) {
            throw io_error("Cannot update WAV header of " + m_path);
        }
        LOG_DEBUG("wav_writer", "Closed", m_path, "with", m_samples, "samples");
    }
}

/**
 * @file wav_writer.hh
 * @brief 16-bit PCM RIFF/WAVE output
 * @ingroup capture
 */

#ifndef AUDIOTAP_WAV_WRITER_HH
#define AUDIOTAP_WAV_WRITER_HH

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include <audiotap/export_audiotap.h>
#include <audiotap/sdk/types.hh>

namespace audiotap {

    /// Size of the canonical RIFF/WAVE header written before the samples
    constexpr std::size_t WAV_HEADER_SIZE = 44;

    /**
     * @brief Build a canonical 44-byte header for 16-bit PCM
     * @param data_bytes Size of the sample data that follows
     */
    AUDIOTAP_EXPORT std::vector<uint8_t> make_wav_header(sample_rate_t rate, channels_t channels,
                                                         uint32_t data_bytes);

    /**
     * @brief Encode a complete in-memory WAV file
     */
    AUDIOTAP_EXPORT std::vector<uint8_t> encode_wav(const int16_t* samples, std::size_t count,
                                                    sample_rate_t rate, channels_t channels = 1);

    /**
     * @class wav_writer
     * @brief Streams 16-bit PCM to a WAV file
     * @ingroup capture
     *
     * The header is written with zero sizes on open and patched by close().
     * The destructor closes the file if close() was not called.
     */
    class AUDIOTAP_EXPORT wav_writer {
        public:
            /**
             * @throws io_error if the file cannot be created
             * @throws config_error for a zero rate or channel count
             */
            wav_writer(const std::string& path, sample_rate_t rate, channels_t channels = 1);
            ~wav_writer();

            wav_writer(const wav_writer&) = delete;
            wav_writer& operator=(const wav_writer&) = delete;

            /**
             * @throws io_error on write failure or if the file would exceed 4 GiB
             */
            void write(const int16_t* samples, std::size_t count);

            void write(const std::vector<int16_t>& samples) {
                write(samples.data(), samples.size());
            }

            /**
             * @brief Patch the header sizes and close the file
             * @throws io_error if the header cannot be updated
             */
            void close();

            [[nodiscard]] bool is_open() const { return m_file.is_open(); }
            [[nodiscard]] uint64_t samples_written() const noexcept { return m_samples; }
            [[nodiscard]] const std::string& path() const noexcept { return m_path; }

        private:
            std::string m_path;
            std::ofstream m_file;
            sample_rate_t m_rate;
            channels_t m_channels;
            uint64_t m_samples = 0;
    };
}

#endif

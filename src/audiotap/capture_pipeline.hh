//
// Per-delivery processing state owned by a capture stream's callback
//

#pragma once

#include <atomic>
#include <cstdint>
#include <vector>

#include <audiotap/export_audiotap.h>
#include <audiotap/capture_config.hh>
#include <audiotap/capture_stats.hh>
#include <audiotap/sdk/capture_backend.hh>
#include <audiotap/sdk/fft_resampler.hh>
#include <audiotap/sdk/output_sink.hh>
#include <audiotap/sdk/ring_buffer.hh>
#include <audiotap/sdk/sample_format.hh>

namespace audiotap {

    /**
     * Everything the audio callback touches. Built before the stream is
     * opened and destroyed only after the stream is closed; process() runs
     * on the backend's real-time thread and never allocates or locks.
     *
     * Per delivery: decode to float, downmix, push into the ring buffer, then
     * while a full resampler block is available pop it, convert, encode to
     * s16 and hand the chunk to the sink.
     */
    class AUDIOTAP_EXPORT capture_pipeline {
        public:
            /**
             * @throws format_error for zero channels or an unsupported encoding
             * @throws converter_error if the resampler cannot be built
             */
            capture_pipeline(const stream_format& format, const capture_config& cfg, output_sink* sink);

            capture_pipeline(const capture_pipeline&) = delete;
            capture_pipeline& operator=(const capture_pipeline&) = delete;

            void process(const uint8_t* data, std::size_t bytes) noexcept;
            void notify_failure() noexcept;

            capture_callbacks callbacks() noexcept;

            [[nodiscard]] capture_stats stats() const noexcept;
            [[nodiscard]] bool failed() const noexcept { return m_failed.load(std::memory_order_acquire); }
            [[nodiscard]] const stream_format& format() const noexcept { return m_format; }
            [[nodiscard]] std::size_t input_block_length() const noexcept { return m_block_in.size(); }
            [[nodiscard]] std::size_t ring_capacity() const noexcept { return m_ring.capacity(); }

        private:
            static void on_data(void* userdata, const uint8_t* data, std::size_t bytes);
            static void on_failure(void* userdata);

            void process_frames(const uint8_t* frames, std::size_t count) noexcept;
            void drain() noexcept;

            const stream_format m_format;
            const std::size_t m_frame_bytes;
            const to_float_converter_func_t m_to_float;
            fft_resampler m_resampler;
            ring_buffer m_ring;
            const std::size_t m_max_frames;

            std::vector<float> m_scratch;
            std::vector<float> m_block_in;
            std::vector<float> m_block_out;
            std::vector<int16_t> m_pcm;
            std::vector<uint8_t> m_carry;
            std::size_t m_carry_len = 0;

            output_sink* m_sink;
            std::atomic<bool> m_failed{false};

            std::atomic<uint64_t> m_frames_received{0};
            std::atomic<uint64_t> m_samples_dropped{0};
            std::atomic<uint64_t> m_conversions{0};
            std::atomic<uint64_t> m_chunks_emitted{0};
            std::atomic<uint64_t> m_samples_emitted{0};
    };
}

#include "capture_pipeline.hh"

#include <audiotap/error.hh>
#include <audiotap/sdk/downmix.hh>
#include <audiotap/sdk/pcm.hh>

#include <algorithm>
#include <cstring>

namespace audiotap {
    namespace {
        const stream_format& checked_format(const stream_format& format) {
            if (format.channels == 0) {
                throw format_error("Capture device reports zero channels");
            }
            return format;
        }
    }

    capture_pipeline::capture_pipeline(const stream_format& format, const capture_config& cfg, output_sink* sink)
        : m_format(checked_format(format)),
          m_frame_bytes(bytes_per_frame(format)),
          m_to_float(get_to_float_converter(format.encoding)),
          m_resampler(format.rate, cfg.target_rate, cfg.chunk_size, cfg.sub_chunks),
          m_ring(cfg.ring_blocks * m_resampler.input_block_length()),
          m_max_frames(std::min(cfg.max_delivery_frames, m_ring.capacity())),
          m_scratch(m_max_frames * format.channels, 0.0f),
          m_block_in(m_resampler.input_block_length(), 0.0f),
          m_block_out(m_resampler.output_block_length(), 0.0f),
          m_pcm(m_resampler.output_block_length(), 0),
          m_carry(m_frame_bytes, 0),
          m_sink(sink) {
    }

    capture_callbacks capture_pipeline::callbacks() noexcept {
        capture_callbacks cb;
        cb.on_data = &capture_pipeline::on_data;
        cb.on_failure = &capture_pipeline::on_failure;
        cb.userdata = this;
        return cb;
    }

    void capture_pipeline::on_data(void* userdata, const uint8_t* data, std::size_t bytes) {
        static_cast<capture_pipeline*>(userdata)->process(data, bytes);
    }

    void capture_pipeline::on_failure(void* userdata) {
        static_cast<capture_pipeline*>(userdata)->notify_failure();
    }

    void capture_pipeline::process(const uint8_t* data, std::size_t bytes) noexcept {
        if (!data || bytes == 0 || m_failed.load(std::memory_order_relaxed)) {
            return;
        }

        std::size_t offset = 0;
        // Complete a frame split across two deliveries
        if (m_carry_len > 0) {
            const auto take = std::min(m_frame_bytes - m_carry_len, bytes);
            std::memcpy(m_carry.data() + m_carry_len, data, take);
            m_carry_len += take;
            offset = take;
            if (m_carry_len < m_frame_bytes) {
                return;
            }
            process_frames(m_carry.data(), 1);
            m_carry_len = 0;
        }

        std::size_t frames = (bytes - offset) / m_frame_bytes;
        while (frames > 0) {
            const auto n = std::min(frames, m_max_frames);
            process_frames(data + offset, n);
            offset += n * m_frame_bytes;
            frames -= n;
        }

        if (offset < bytes) {
            m_carry_len = bytes - offset;
            std::memcpy(m_carry.data(), data + offset, m_carry_len);
        }
    }

    void capture_pipeline::process_frames(const uint8_t* frames, std::size_t count) noexcept {
        m_to_float(m_scratch.data(), frames, count * m_format.channels);
        downmix(m_scratch.data(), m_scratch.data(), count, m_format.channels);

        const auto pushed = m_ring.push(m_scratch.data(), count);
        m_frames_received.fetch_add(count, std::memory_order_relaxed);
        if (pushed < count) {
            m_samples_dropped.fetch_add(count - pushed, std::memory_order_relaxed);
        }
        drain();
    }

    void capture_pipeline::drain() noexcept {
        const auto block = m_block_in.size();
        while (m_ring.occupied_len() >= block) {
            m_ring.pop_into(m_block_in.data(), block);
            const auto produced = m_resampler.convert(m_block_in.data(), m_block_out.data());
            m_conversions.fetch_add(1, std::memory_order_relaxed);
            if (produced == 0) {
                continue;
            }
            float_to_s16(m_pcm.data(), m_block_out.data(), produced);
            if (m_sink) {
                m_sink->on_chunk(m_pcm.data(), produced);
            }
            m_chunks_emitted.fetch_add(1, std::memory_order_relaxed);
            m_samples_emitted.fetch_add(produced, std::memory_order_relaxed);
        }
    }

    void capture_pipeline::notify_failure() noexcept {
        if (m_failed.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        if (m_sink) {
            m_sink->on_stream_failed();
        }
    }

    capture_stats capture_pipeline::stats() const noexcept {
        capture_stats s;
        s.frames_received = m_frames_received.load(std::memory_order_relaxed);
        s.samples_dropped = m_samples_dropped.load(std::memory_order_relaxed);
        s.conversions = m_conversions.load(std::memory_order_relaxed);
        s.chunks_emitted = m_chunks_emitted.load(std::memory_order_relaxed);
        s.samples_emitted = m_samples_emitted.load(std::memory_order_relaxed);
        return s;
    }
}

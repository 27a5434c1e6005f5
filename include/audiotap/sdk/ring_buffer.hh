/**
 * @file ring_buffer.hh
 * @brief Lock-free single-producer/single-consumer sample queue
 * @ingroup sdk_buffers
 */

#ifndef AUDIOTAP_SDK_RING_BUFFER_HH
#define AUDIOTAP_SDK_RING_BUFFER_HH

#include <atomic>
#include <cstddef>
#include <memory>
#include <audiotap/sdk/export_audiotap_sdk.h>

namespace audiotap {

    /**
     * @class ring_buffer
     * @brief Fixed-capacity circular queue of mono float samples
     * @ingroup sdk_buffers
     *
     * Bridges the irregular block sizes delivered by the audio callback and
     * the fixed block size the resampler consumes. The storage is allocated
     * once in the constructor; push and pop never allocate and never block.
     *
     * ## Threading
     *
     * Exactly one producer thread may call push() and exactly one consumer
     * thread may call pop_into(). occupied_len() may be called from either.
     * In the capture pipeline both sides run on the audio callback thread.
     *
     * ## Overrun
     *
     * Writes into a full buffer are dropped and reported by the return value.
     *
     * @code
     * ring_buffer rb(4 * resampler.input_block_length());
     * rb.push(sample);
     * if (rb.occupied_len() >= block) {
     *     rb.pop_into(block_buffer, block);
     * }
     * @endcode
     */
    class AUDIOTAP_SDK_EXPORT ring_buffer {
        public:
            /**
             * @param capacity Number of samples the buffer holds (must be > 0)
             * @throws std::invalid_argument if capacity is zero
             */
            explicit ring_buffer(std::size_t capacity);
            ~ring_buffer();

            ring_buffer(const ring_buffer&) = delete;
            ring_buffer& operator=(const ring_buffer&) = delete;

            /**
             * @brief Append one sample
             * @return false if the buffer was full and the sample was dropped
             */
            bool push(float sample) noexcept;

            /**
             * @brief Append up to @p count samples
             * @return Number of samples stored; the rest were dropped
             */
            std::size_t push(const float* samples, std::size_t count) noexcept;

            /**
             * @brief Move up to @p count samples into @p dst in FIFO order
             * @return Number of samples copied
             */
            std::size_t pop_into(float* dst, std::size_t count) noexcept;

            [[nodiscard]] std::size_t occupied_len() const noexcept;
            [[nodiscard]] std::size_t free_len() const noexcept;
            [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }

        private:
            std::unique_ptr<float[]> m_data;
            const std::size_t m_capacity;
            // Monotonic counters; slot index is counter % capacity
            std::atomic<std::size_t> m_write{0};
            std::atomic<std::size_t> m_read{0};
    };
}

#endif // AUDIOTAP_SDK_RING_BUFFER_HH

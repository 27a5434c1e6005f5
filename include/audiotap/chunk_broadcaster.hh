/**
 * @file chunk_broadcaster.hh
 * @brief Fan-out output sink with a lock-free hand-off from the audio thread
 * @ingroup capture
 */

#ifndef AUDIOTAP_CHUNK_BROADCASTER_HH
#define AUDIOTAP_CHUNK_BROADCASTER_HH

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <audiotap/export_audiotap.h>
#include <audiotap/sdk/output_sink.hh>

namespace audiotap {

    /**
     * @class chunk_broadcaster
     * @brief Delivers every captured chunk to any number of subscribers
     * @ingroup capture
     *
     * The audio thread copies each chunk into one of a fixed number of
     * pre-allocated slots (single producer, single consumer). A host thread
     * calls dispatch() to move pending chunks out and invoke every subscriber
     * with its own copy, in capture order.
     *
     * If the host falls behind and all slots are full, new chunks are dropped
     * and counted in dropped_chunks().
     *
     * @code
     * auto sink = std::make_shared<chunk_broadcaster>(1024);
     * auto id = sink->subscribe([](const std::vector<int16_t>& pcm) {
     *     transcriber.feed(pcm);
     * });
     * capture_session session(backend, cfg, sink);
     * session.start();
     * while (running) {
     *     sink->dispatch();
     *     std::this_thread::sleep_for(10ms);
     * }
     * @endcode
     */
    class AUDIOTAP_EXPORT chunk_broadcaster : public output_sink {
        public:
            using subscriber_t = std::function<void(const std::vector<int16_t>& chunk)>;
            using subscription_id = uint32_t;

            /**
             * @param max_chunk_samples Largest chunk on_chunk() will receive
             * @param slot_count Number of chunks that can wait for dispatch()
             */
            explicit chunk_broadcaster(std::size_t max_chunk_samples, std::size_t slot_count = 64);
            ~chunk_broadcaster() override;

            chunk_broadcaster(const chunk_broadcaster&) = delete;
            chunk_broadcaster& operator=(const chunk_broadcaster&) = delete;

            // output_sink, audio thread
            void on_chunk(const int16_t* samples, std::size_t count) override;
            void on_stream_failed() override;

            /**
             * @brief Register a chunk consumer
             * @return Token for unsubscribe()
             */
            subscription_id subscribe(subscriber_t callback);

            /**
             * @brief Remove a consumer; unknown ids are ignored
             */
            void unsubscribe(subscription_id id);

            /**
             * @brief Deliver all pending chunks to the current subscribers
             * @return Number of chunks delivered
             *
             * Must not be called from a subscriber.
             */
            std::size_t dispatch();

            [[nodiscard]] std::size_t pending() const noexcept;
            [[nodiscard]] std::size_t subscriber_count() const;
            [[nodiscard]] uint64_t dropped_chunks() const noexcept;
            [[nodiscard]] bool stream_failed() const noexcept;

        private:
            struct slot {
                std::vector<int16_t> samples;
                std::size_t size = 0;
            };

            const std::size_t m_max_chunk_samples;
            std::vector<slot> m_slots;
            std::atomic<std::size_t> m_write{0};
            std::atomic<std::size_t> m_read{0};
            std::atomic<uint64_t> m_dropped{0};
            std::atomic<bool> m_stream_failed{false};

            std::mutex m_dispatch_mutex;
            mutable std::mutex m_subscribers_mutex;
            std::map<subscription_id, subscriber_t> m_subscribers;
            subscription_id m_next_id = 1;
    };
}

#endif

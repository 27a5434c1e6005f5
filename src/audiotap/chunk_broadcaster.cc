#include <audiotap/chunk_broadcaster.hh>
#include <audiotap/error.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>
#include <cstring>

namespace audiotap {
    chunk_broadcaster::chunk_broadcaster(std::size_t max_chunk_samples, std::size_t slot_count)
        : m_max_chunk_samples(max_chunk_samples) {
        if (max_chunk_samples == 0) {
            throw config_error("chunk_broadcaster: chunk size must be positive");
        }
        if (slot_count == 0) {
            throw config_error("chunk_broadcaster: slot count must be positive");
        }
        m_slots.resize(slot_count);
        for (auto& s : m_slots) {
            s.samples.resize(max_chunk_samples, 0);
        }
    }

    chunk_broadcaster::~chunk_broadcaster() = default;

    void chunk_broadcaster::on_chunk(const int16_t* samples, std::size_t count) {
        const auto w = m_write.load(std::memory_order_relaxed);
        const auto r = m_read.load(std::memory_order_acquire);
        if (w - r >= m_slots.size()) {
            m_dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        auto& s = m_slots[w % m_slots.size()];
        s.size = std::min(count, m_max_chunk_samples);
        std::memcpy(s.samples.data(), samples, s.size * sizeof(int16_t));
        m_write.store(w + 1, std::memory_order_release);
    }

    void chunk_broadcaster::on_stream_failed() {
        m_stream_failed.store(true, std::memory_order_release);
    }

    chunk_broadcaster::subscription_id chunk_broadcaster::subscribe(subscriber_t callback) {
        if (!callback) {
            throw config_error("chunk_broadcaster: empty subscriber");
        }
        std::lock_guard<std::mutex> lock(m_subscribers_mutex);
        const auto id = m_next_id++;
        m_subscribers.emplace(id, std::move(callback));
        LOG_DEBUG("chunk_broadcaster", "Subscriber", id, "added, total", m_subscribers.size());
        return id;
    }

    void chunk_broadcaster::unsubscribe(subscription_id id) {
        std::lock_guard<std::mutex> lock(m_subscribers_mutex);
        if (m_subscribers.erase(id) == 0) {
            LOG_WARN("chunk_broadcaster", "Unsubscribe of unknown id", id);
            return;
        }
        LOG_DEBUG("chunk_broadcaster", "Subscriber", id, "removed, total", m_subscribers.size());
    }

    std::size_t chunk_broadcaster::dispatch() {
        std::lock_guard<std::mutex> dispatch_lock(m_dispatch_mutex);

        std::vector<subscriber_t> targets;
        {
            std::lock_guard<std::mutex> lock(m_subscribers_mutex);
            targets.reserve(m_subscribers.size());
            for (const auto& kv : m_subscribers) {
                targets.push_back(kv.second);
            }
        }

        std::size_t delivered = 0;
        auto r = m_read.load(std::memory_order_relaxed);
        while (r != m_write.load(std::memory_order_acquire)) {
            const auto& s = m_slots[r % m_slots.size()];
            std::vector<int16_t> chunk(s.samples.begin(),
                                       s.samples.begin() + static_cast<std::ptrdiff_t>(s.size));
            // Release the slot before running subscribers
            m_read.store(++r, std::memory_order_release);

            for (const auto& target : targets) {
                target(chunk);
            }
            delivered++;
        }
        return delivered;
    }

    std::size_t chunk_broadcaster::pending() const noexcept {
        return m_write.load(std::memory_order_acquire) - m_read.load(std::memory_order_acquire);
    }

    std::size_t chunk_broadcaster::subscriber_count() const {
        std::lock_guard<std::mutex> lock(m_subscribers_mutex);
        return m_subscribers.size();
    }

    uint64_t chunk_broadcaster::dropped_chunks() const noexcept {
        return m_dropped.load(std::memory_order_relaxed);
    }

    bool chunk_broadcaster::stream_failed() const noexcept {
        return m_stream_failed.load(std::memory_order_acquire);
    }
}

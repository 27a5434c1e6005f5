#include <audiotap/sdk/ring_buffer.hh>

#include <algorithm>
#include <stdexcept>

namespace audiotap {
    ring_buffer::ring_buffer(std::size_t capacity)
        : m_data(nullptr),
          m_capacity(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("ring_buffer capacity must be positive");
        }
        m_data = std::make_unique<float[]>(capacity);
        std::fill_n(m_data.get(), capacity, 0.0f);
    }

    ring_buffer::~ring_buffer() = default;

    bool ring_buffer::push(float sample) noexcept {
        const auto w = m_write.load(std::memory_order_relaxed);
        const auto r = m_read.load(std::memory_order_acquire);
        if (w - r >= m_capacity) {
            return false;
        }
        m_data[w % m_capacity] = sample;
        m_write.store(w + 1, std::memory_order_release);
        return true;
    }

    std::size_t ring_buffer::push(const float* samples, std::size_t count) noexcept {
        const auto w = m_write.load(std::memory_order_relaxed);
        const auto r = m_read.load(std::memory_order_acquire);
        const auto n = std::min(count, m_capacity - (w - r));
        if (n == 0) {
            return 0;
        }
        const auto pos = w % m_capacity;
        const auto first = std::min(n, m_capacity - pos);
        std::copy_n(samples, first, m_data.get() + pos);
        std::copy_n(samples + first, n - first, m_data.get());
        m_write.store(w + n, std::memory_order_release);
        return n;
    }

    std::size_t ring_buffer::pop_into(float* dst, std::size_t count) noexcept {
        const auto r = m_read.load(std::memory_order_relaxed);
        const auto w = m_write.load(std::memory_order_acquire);
        const auto n = std::min(count, w - r);
        if (n == 0) {
            return 0;
        }
        const auto pos = r % m_capacity;
        const auto first = std::min(n, m_capacity - pos);
        std::copy_n(m_data.get() + pos, first, dst);
        std::copy_n(m_data.get(), n - first, dst + first);
        m_read.store(r + n, std::memory_order_release);
        return n;
    }

    std::size_t ring_buffer::occupied_len() const noexcept {
        const auto r = m_read.load(std::memory_order_acquire);
        const auto w = m_write.load(std::memory_order_acquire);
        return w - r;
    }

    std::size_t ring_buffer::free_len() const noexcept {
        return m_capacity - occupied_len();
    }
}

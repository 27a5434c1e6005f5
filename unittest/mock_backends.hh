#ifndef AUDIOTAP_MOCK_BACKENDS_HH
#define AUDIOTAP_MOCK_BACKENDS_HH

#include <audiotap/sdk/capture_backend.hh>
#include <audiotap/error.hh>
#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace audiotap::test {

    class mock_capture_backend;

    // Stream driven by the test thread, which plays the audio thread's role
    class mock_capture_stream : public capture_stream {
        private:
            mock_capture_backend* m_backend;
            device_info m_device;
            capture_callbacks m_callbacks;
            std::atomic<bool> m_running{false};
            std::atomic<bool> m_failed{false};

        public:
            std::atomic<int> resume_calls{0};
            std::atomic<int> deliver_calls{0};

            // Configurable behaviors
            std::function<void()> on_resume;

            mock_capture_stream(mock_capture_backend* backend, const device_info& device,
                                const capture_callbacks& callbacks)
                : m_backend(backend), m_device(device), m_callbacks(callbacks) {}

            ~mock_capture_stream() override;

            void resume() override {
                resume_calls++;
                if (on_resume) {
                    on_resume();
                }
                m_running = true;
            }

            bool has_failed() const override {
                return m_failed;
            }

            const stream_format& format() const override {
                return m_device.format;
            }

            const device_info& device() const { return m_device; }
            bool is_running() const { return m_running; }

            // Hand raw device bytes to the capture callback; ignored while paused
            void deliver(const void* data, std::size_t bytes) {
                if (!m_running || !m_callbacks.on_data) {
                    return;
                }
                deliver_calls++;
                m_callbacks.on_data(m_callbacks.userdata, static_cast<const uint8_t*>(data), bytes);
            }

            template<typename T>
            void deliver(const std::vector<T>& samples) {
                deliver(samples.data(), samples.size() * sizeof(T));
            }

            // Simulate device loss
            void fail() {
                if (m_failed.exchange(true)) {
                    return;
                }
                m_running = false;
                if (m_callbacks.on_failure) {
                    m_callbacks.on_failure(m_callbacks.userdata);
                }
            }
    };

    class mock_capture_backend : public capture_backend {
        private:
            bool m_initialized{false};
            std::vector<device_info> m_devices;
            std::vector<mock_capture_stream*> m_streams;
            mutable std::mutex m_mutex;

            friend class mock_capture_stream;

            void stream_closed(mock_capture_stream* stream) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_streams.erase(std::remove(m_streams.begin(), m_streams.end(), stream), m_streams.end());
                close_calls++;
            }

        public:
            // Statistics for testing
            std::atomic<int> init_calls{0};
            std::atomic<int> shutdown_calls{0};
            std::atomic<int> resolve_calls{0};
            std::atomic<int> open_calls{0};
            std::atomic<int> close_calls{0};
            std::atomic<int> pump_calls{0};

            // Configurable behaviors
            std::function<void(const device_info&)> on_open;
            // Runs on every new stream before it is returned to the caller
            std::function<void(mock_capture_stream&)> on_stream_opened;

            // Error injection
            bool fail_init{false};
            bool fail_open{false};
            bool fail_resume{false};

            mock_capture_backend() {
                device_info monitor;
                monitor.name = "Monitor of Mock Speakers";
                monitor.id = "mock_monitor";
                monitor.is_default = true;
                monitor.source = capture_source::loopback;
                monitor.format = {48000, 2, sample_encoding::f32};
                m_devices.push_back(monitor);

                device_info mic;
                mic.name = "Mock Microphone";
                mic.id = "mock_mic";
                mic.is_default = true;
                mic.source = capture_source::input;
                mic.format = {48000, 2, sample_encoding::s16};
                m_devices.push_back(mic);

                device_info usb;
                usb.name = "Mock USB Microphone";
                usb.id = "mock_usb";
                usb.is_default = false;
                usb.source = capture_source::input;
                usb.format = {44100, 1, sample_encoding::s16};
                m_devices.push_back(usb);
            }

            void add_device(const device_info& info) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_devices.push_back(info);
            }

            void clear_devices() {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_devices.clear();
            }

            void init() override {
                init_calls++;
                if (fail_init) {
                    throw device_error("Mock backend init failed");
                }
                if (m_initialized) {
                    throw std::runtime_error("Mock backend already initialized");
                }
                m_initialized = true;
            }

            void shutdown() override {
                shutdown_calls++;
                m_initialized = false;
            }

            std::string get_name() const override {
                return "Mock";
            }

            bool is_initialized() const override {
                return m_initialized;
            }

            std::vector<device_info> enumerate_devices(capture_source source) override {
                if (!m_initialized) {
                    throw device_error("Mock backend not initialized");
                }
                std::lock_guard<std::mutex> lock(m_mutex);
                std::vector<device_info> result;
                for (const auto& dev : m_devices) {
                    if (dev.source == source) {
                        result.push_back(dev);
                    }
                }
                return result;
            }

            device_info resolve_device(const std::string& device_id, capture_source source) override {
                resolve_calls++;
                auto devices = enumerate_devices(source);
                const bool want_default = device_id.empty() || device_id == "default";
                for (const auto& dev : devices) {
                    if (want_default ? dev.is_default : (dev.id == device_id || dev.name == device_id)) {
                        return dev;
                    }
                }
                throw device_error("Mock device not found: " + device_id);
            }

            std::unique_ptr<capture_stream> open_stream(const device_info& device,
                                                        const capture_callbacks& callbacks) override {
                open_calls++;
                if (on_open) {
                    on_open(device);
                }
                if (fail_open) {
                    throw stream_error("Mock stream open failed");
                }
                auto stream = std::make_unique<mock_capture_stream>(this, device, callbacks);
                if (fail_resume) {
                    stream->on_resume = [] { throw stream_error("Mock stream start failed"); };
                }
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_streams.push_back(stream.get());
                }
                if (on_stream_opened) {
                    on_stream_opened(*stream);
                }
                return stream;
            }

            void pump_events() override {
                pump_calls++;
            }

            // Open streams, oldest first
            std::size_t open_stream_count() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_streams.size();
            }

            mock_capture_stream* active_stream() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_streams.empty() ? nullptr : m_streams.back();
            }
    };

    inline mock_capture_stream::~mock_capture_stream() {
        m_running = false;
        m_backend->stream_closed(this);
    }

    inline std::shared_ptr<mock_capture_backend> create_mock_backend() {
        auto backend = std::make_shared<mock_capture_backend>();
        backend->init();
        return backend;
    }

} // namespace audiotap::test

#endif // AUDIOTAP_MOCK_BACKENDS_HH

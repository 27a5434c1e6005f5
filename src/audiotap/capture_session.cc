#include <audiotap/capture_session.hh>
#include <audiotap/error.hh>
#include <failsafe/failsafe.hh>

#include "capture_pipeline.hh"

#include <atomic>
#include <mutex>
#include <utility>

namespace audiotap {
    const char* to_string(session_state state) {
        switch (state) {
            case session_state::idle: return "idle";
            case session_state::starting: return "starting";
            case session_state::active: return "active";
        }
        return "unknown";
    }

    namespace {
        // Stream and the pipeline its callbacks point into.
        // Member order makes the stream go first on destruction.
        struct open_capture {
            device_info device;
            std::unique_ptr<capture_pipeline> pipeline;
            std::unique_ptr<capture_stream> stream;

            void close() {
                stream.reset();
                pipeline.reset();
            }
        };
    }

    struct capture_session::impl {
        std::shared_ptr<capture_backend> backend;
        capture_config config;
        std::shared_ptr<output_sink> sink;

        mutable std::mutex mutex;
        std::atomic<session_state> state{session_state::idle};
        std::size_t refs = 0;
        std::string device_id;

        open_capture current;
        device_info last_device;
        capture_stats last_stats;

        // Resolve, build the pipeline and open the stream paused
        open_capture prepare(const std::string& id) {
            if (!backend->is_initialized()) {
                throw device_error("Capture backend " + backend->get_name() + " is not initialized");
            }

            open_capture result;
            result.device = backend->resolve_device(id, config.source);
            LOG_INFO("capture_session", "Opening", to_string(config.source), "device",
                     result.device.name, "at", result.device.format.rate, "Hz,",
                     static_cast<int>(result.device.format.channels), "channels");

            result.pipeline = std::make_unique<capture_pipeline>(result.device.format, config, sink.get());
            result.stream = backend->open_stream(result.device, result.pipeline->callbacks());
            return result;
        }

        // The sink has a single producer: the old stream is gone before the new one runs.
        // On throw nothing is open.
        void activate(open_capture next) {
            close_current();
            current = std::move(next);
            try {
                current.stream->resume();
            } catch (const std::exception&) {
                current.close();
                throw;
            }
            last_device = current.device;
        }

        void close_current() {
            if (current.pipeline) {
                current.stream.reset();
                last_stats = current.pipeline->stats();
                LOG_INFO("capture_session", "Closed", current.device.name, last_stats);
            }
            current.close();
        }

        void become_idle() {
            refs = 0;
            state.store(session_state::idle);
        }

        bool failed_locked() const {
            if (!current.stream) {
                return false;
            }
            return current.stream->has_failed() || current.pipeline->failed();
        }

        void start_locked(const std::string* requested) {
            if (state.load() == session_state::active) {
                if (requested && *requested != device_id) {
                    LOG_INFO("capture_session", "Already capturing from", current.device.name,
                             "- ignoring requested device", *requested);
                }
                if (failed_locked()) {
                    LOG_WARN("capture_session", "Stream on", current.device.name, "failed, reopening");
                    auto next = prepare(device_id);
                    try {
                        activate(std::move(next));
                    } catch (const std::exception& e) {
                        LOG_ERROR("capture_session", "Reopen failed, capture stopped:", e.what());
                        become_idle();
                        throw;
                    }
                }
                refs++;
                LOG_DEBUG("capture_session", "Capture joined, references:", refs);
                return;
            }

            const std::string id = requested ? *requested : device_id;
            state.store(session_state::starting);
            try {
                activate(prepare(id));
            } catch (const std::exception& e) {
                state.store(session_state::idle);
                LOG_ERROR("capture_session", "Failed to start capture:", e.what());
                throw;
            }
            device_id = id;
            refs = 1;
            state.store(session_state::active);
            LOG_INFO("capture_session", "Capture started on", current.device.name);
        }
    };

    capture_session::capture_session(std::shared_ptr<capture_backend> backend,
                                     capture_config cfg,
                                     std::shared_ptr<output_sink> sink)
        : m_pimpl(std::make_unique<impl>()) {
        if (!backend) {
            throw device_error("No capture backend");
        }
        if (!sink) {
            throw config_error("No output sink");
        }
        cfg.validate();

        m_pimpl->backend = std::move(backend);
        m_pimpl->device_id = cfg.device_id;
        m_pimpl->config = std::move(cfg);
        m_pimpl->sink = std::move(sink);
    }

    capture_session::~capture_session() {
        if (m_pimpl) {
            std::lock_guard<std::mutex> lock(m_pimpl->mutex);
            m_pimpl->close_current();
        }
    }

    void capture_session::start() {
        std::lock_guard<std::mutex> lock(m_pimpl->mutex);
        m_pimpl->start_locked(nullptr);
    }

    void capture_session::start(const std::string& device_id) {
        std::lock_guard<std::mutex> lock(m_pimpl->mutex);
        m_pimpl->start_locked(&device_id);
    }

    void capture_session::stop() {
        std::lock_guard<std::mutex> lock(m_pimpl->mutex);
        if (m_pimpl->refs == 0) {
            LOG_DEBUG("capture_session", "Stop ignored, capture is not running");
            return;
        }
        if (--m_pimpl->refs > 0) {
            LOG_DEBUG("capture_session", "Capture released, references:", m_pimpl->refs);
            return;
        }
        m_pimpl->close_current();
        m_pimpl->state.store(session_state::idle);
        LOG_INFO("capture_session", "Capture stopped");
    }

    void capture_session::force_stop() {
        std::lock_guard<std::mutex> lock(m_pimpl->mutex);
        if (m_pimpl->state.load() == session_state::idle) {
            return;
        }
        LOG_INFO("capture_session", "Forcing stop with", m_pimpl->refs, "references outstanding");
        m_pimpl->close_current();
        m_pimpl->become_idle();
    }

    void capture_session::switch_device(const std::string& device_id) {
        std::lock_guard<std::mutex> lock(m_pimpl->mutex);
        if (m_pimpl->state.load() != session_state::active) {
            m_pimpl->device_id = device_id;
            LOG_INFO("capture_session", "Next capture will use device", device_id);
            return;
        }

        auto next = m_pimpl->prepare(device_id);
        LOG_INFO("capture_session", "Switching from", m_pimpl->current.device.name, "to", next.device.name);
        try {
            m_pimpl->activate(std::move(next));
        } catch (const std::exception& e) {
            LOG_ERROR("capture_session", "Could not start", device_id, ":", e.what());
            try {
                m_pimpl->activate(m_pimpl->prepare(m_pimpl->device_id));
                LOG_INFO("capture_session", "Restored capture on", m_pimpl->current.device.name);
            } catch (const std::exception& restore) {
                LOG_ERROR("capture_session", "Restore failed, capture stopped:", restore.what());
                m_pimpl->become_idle();
            }
            throw;
        }
        m_pimpl->device_id = device_id;
    }

    session_state capture_session::state() const noexcept {
        return m_pimpl->state.load();
    }

    std::size_t capture_session::ref_count() const {
        std::lock_guard<std::mutex> lock(m_pimpl->mutex);
        return m_pimpl->refs;
    }

    bool capture_session::is_active() const noexcept {
        return m_pimpl->state.load() == session_state::active;
    }

    bool capture_session::stream_failed() const {
        std::lock_guard<std::mutex> lock(m_pimpl->mutex);
        return m_pimpl->failed_locked();
    }

    device_info capture_session::device() const {
        std::lock_guard<std::mutex> lock(m_pimpl->mutex);
        return m_pimpl->last_device;
    }

    capture_stats capture_session::stats() const {
        std::lock_guard<std::mutex> lock(m_pimpl->mutex);
        if (m_pimpl->current.pipeline) {
            return m_pimpl->current.pipeline->stats();
        }
        return m_pimpl->last_stats;
    }

    const capture_config& capture_session::config() const noexcept {
        return m_pimpl->config;
    }
}

/**
 * @file capture_session.hh
 * @brief Reference-counted capture lifecycle
 * @ingroup capture
 */

#ifndef AUDIOTAP_CAPTURE_SESSION_HH
#define AUDIOTAP_CAPTURE_SESSION_HH

#include <cstddef>
#include <memory>
#include <string>

#include <audiotap/capture_config.hh>
#include <audiotap/capture_stats.hh>
#include <audiotap/export_audiotap.h>
#include <audiotap/sdk/capture_backend.hh>
#include <audiotap/sdk/output_sink.hh>

namespace audiotap {

    enum class session_state {
        idle,
        starting,
        active
    };

    AUDIOTAP_EXPORT const char* to_string(session_state state);

    /**
     * @class capture_session
     * @brief Owns at most one open capture stream and the buffers its callback uses
     * @ingroup capture
     *
     * Every start() must be paired with a stop(). The first start() opens the
     * device; later calls only bump the reference count and share the running
     * stream. The stream is closed when the count returns to zero.
     *
     * Chunks flow to the sink given at construction, on the audio thread.
     *
     * ## Thread Safety
     *
     * All methods may be called from any thread. Lifecycle transitions are
     * serialized by one mutex; the audio callback never takes it.
     *
     * @code
     * auto backend = create_sdl3_backend();
     * backend->init();
     * auto sink = std::make_shared<chunk_broadcaster>(cfg.chunk_size, cfg.sink_slots);
     * capture_session session(backend, cfg, sink);
     * session.start();          // opens the device
     * session.start();          // shares it, ref_count() == 2
     * session.stop();
     * session.stop();           // closes the device
     * @endcode
     */
    class AUDIOTAP_EXPORT capture_session {
        public:
            /**
             * @throws config_error if cfg is invalid or sink is null
             * @throws device_error if backend is null
             */
            capture_session(std::shared_ptr<capture_backend> backend,
                            capture_config cfg,
                            std::shared_ptr<output_sink> sink);
            ~capture_session();

            capture_session(const capture_session&) = delete;
            capture_session& operator=(const capture_session&) = delete;

            /**
             * @brief Start capture on the configured device, or join the running capture
             *
             * @throws device_error if the device cannot be found
             * @throws format_error if its format is unsupported
             * @throws converter_error if no resampler exists for its rate
             * @throws stream_error if the stream cannot be opened or started
             *
             * On failure the session stays idle and the reference count is unchanged.
             * A running stream that has failed is replaced; if its replacement
             * opens but cannot be started the session becomes idle.
             */
            void start();

            /**
             * @brief As start(), opening device_id if the session is idle
             *
             * While active the argument is ignored; use switch_device() to move
             * a running capture. The device is remembered for later start()
             * calls only if this one succeeds.
             */
            void start(const std::string& device_id);

            /**
             * @brief Release one reference; the last one closes the stream
             *
             * Never throws. Calling it with no references is a no-op.
             */
            void stop();

            /**
             * @brief Close the stream regardless of outstanding references
             */
            void force_stop();

            /**
             * @brief Move capture to another device
             *
             * While active the new stream is opened paused, the old one is
             * closed and only then is the new one started, so the sink never
             * sees two producers. If the new device cannot be opened the old
             * stream keeps running. If it opens but fails to start, the old
             * device is reopened; should that fail too the session becomes
             * idle. The original error is rethrown in both cases.
             *
             * While idle only the device for the next start() changes.
             */
            void switch_device(const std::string& device_id);

            [[nodiscard]] session_state state() const noexcept;
            [[nodiscard]] std::size_t ref_count() const;
            [[nodiscard]] bool is_active() const noexcept;

            /**
             * @return true if the open stream reported a runtime error.
             * The next start() replaces such a stream.
             */
            [[nodiscard]] bool stream_failed() const;

            /**
             * @return The open device, or the last one opened when idle
             */
            [[nodiscard]] device_info device() const;

            /**
             * @return Counters of the open stream, or of the last stream when idle
             */
            [[nodiscard]] capture_stats stats() const;

            [[nodiscard]] const capture_config& config() const noexcept;

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };
}

#endif

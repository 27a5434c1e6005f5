/**
 * @file capture_config.hh
 * @brief Capture session configuration
 * @ingroup capture
 */

#ifndef AUDIOTAP_CAPTURE_CONFIG_HH
#define AUDIOTAP_CAPTURE_CONFIG_HH

#include <string>
#include <audiotap/export_audiotap.h>
#include <audiotap/sdk/capture_backend.hh>
#include <audiotap/sdk/types.hh>

namespace audiotap {

    /**
     * @struct capture_config
     * @brief Parameters fixed for the lifetime of one capture stream
     * @ingroup capture
     *
     * The defaults produce 1024-sample chunks of 16 kHz mono PCM from the
     * system's default loopback source.
     *
     * @code
     * capture_config cfg;
     * cfg.source = capture_source::input;
     * apply_environment(cfg);   // AUDIOTAP_DEVICE / AUDIOTAP_SOURCE
     * cfg.validate();
     * @endcode
     */
    struct AUDIOTAP_EXPORT capture_config {
        std::string device_id = "default";              ///< Device to open on start()
        capture_source source = capture_source::loopback;
        sample_rate_t target_rate = 16000;              ///< Output rate in Hz
        std::size_t chunk_size = 1024;                  ///< Output chunk length in samples
        std::size_t sub_chunks = 2;                     ///< FFT units per output chunk
        std::size_t ring_blocks = 4;                    ///< Ring capacity in resampler input blocks
        std::size_t max_delivery_frames = 4096;         ///< Scratch size for one conversion pass
        std::size_t sink_slots = 64;                    ///< Chunks the broadcaster can hold

        /**
         * @throws config_error naming the first invalid field
         */
        void validate() const;
    };

    /**
     * @brief Override device and source from the environment
     *
     * Reads AUDIOTAP_DEVICE and AUDIOTAP_SOURCE when set and non-empty.
     *
     * @throws config_error if AUDIOTAP_SOURCE is not a known source
     */
    AUDIOTAP_EXPORT void apply_environment(capture_config& cfg);
}

#endif

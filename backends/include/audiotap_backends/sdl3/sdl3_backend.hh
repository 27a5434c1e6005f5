/**
 * @file sdl3_backend.hh
 * @brief SDL3 capture backend factory
 * @ingroup backends
 */

#ifndef AUDIOTAP_BACKENDS_SDL3_BACKEND_HH
#define AUDIOTAP_BACKENDS_SDL3_BACKEND_HH

#include <memory>

// Include generated export header
#include "export_audiotap_backend_sdl3.h"

namespace audiotap {

/**
 * @defgroup sdl3_backend SDL3 Capture Backend
 * @ingroup backends
 * @brief Audio capture through SDL3's recording streams
 *
 * ## Sources
 *
 * - **input**: every SDL recording device that is not a monitor
 * - **loopback**: PulseAudio/PipeWire monitor sources ("Monitor of ...").
 *   SDL lists them only when SDL_HINT_AUDIO_INCLUDE_MONITORS is set, which
 *   init() does. Other platforms have no loopback devices.
 *
 * The default loopback device is the monitor of the default playback
 * device, or the first monitor found.
 *
 * ## Formats
 *
 * Streams deliver s16 when the device is natively 16-bit and f32 otherwise;
 * SDL converts any other device format to f32.
 *
 * ## Device loss
 *
 * Removal of the device is reported through an SDL event watch; the stream
 * is marked failed and the failure callback runs on the thread that posted
 * the event. Call pump_events() regularly from the main thread.
 *
 * ## Configuration
 *
 * SDL3 environment variables apply, e.g. `SDL_AUDIO_DRIVER=dummy`.
 *
 * @{
 */

// Forward declaration
class capture_backend;

/**
 * @brief Create an SDL3 capture backend instance
 * @return New, uninitialized backend
 *
 * @code
 * #include <audiotap_backends/sdl3/sdl3_backend.hh>
 *
 * std::shared_ptr<audiotap::capture_backend> backend = audiotap::create_sdl3_backend();
 * backend->init();
 * for (const auto& dev : backend->enumerate_devices(audiotap::capture_source::loopback)) {
 *     std::cout << dev << "\n";
 * }
 * @endcode
 */
AUDIOTAP_BACKEND_SDL3_EXPORT std::unique_ptr<capture_backend> create_sdl3_backend();

/** @} */ // end of sdl3_backend group

} // namespace audiotap

#endif // AUDIOTAP_BACKENDS_SDL3_BACKEND_HH

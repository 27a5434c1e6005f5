/**
 * @file capture_backend.hh
 * @brief Platform audio capture interface
 * @ingroup backends
 */

#ifndef AUDIOTAP_SDK_CAPTURE_BACKEND_HH
#define AUDIOTAP_SDK_CAPTURE_BACKEND_HH

#include <string>
#include <memory>
#include <vector>
#include <ostream>
#include <audiotap/sdk/sample_format.hh>
#include <audiotap/sdk/types.hh>
#include <audiotap/sdk/export_audiotap_sdk.h>

namespace audiotap {

/**
 * @enum capture_source
 * @brief What a capture device records
 */
enum class capture_source : uint8_t {
    input,     ///< Microphone or line-in
    loopback   ///< Whatever a playback device is outputting
};

AUDIOTAP_SDK_EXPORT const char* to_string(capture_source src);

/**
 * @brief Parse "input" / "loopback" (also "mic", "output", "system")
 * @throws config_error for anything else
 */
AUDIOTAP_SDK_EXPORT capture_source parse_capture_source(const std::string& text);

/**
 * @struct device_info
 * @brief Capture device information
 * @ingroup backends
 */
struct device_info {
    std::string name;           ///< Human-readable device name
    std::string id;             ///< Backend identifier ("default" for the system default)
    bool is_default = false;    ///< True if this is the default device for its source
    capture_source source = capture_source::input;
    stream_format format;       ///< Native rate, channels and encoding
};

/**
 * @brief Stream output operator for device_info
 *
 * Formats device information for debugging output.
 */
inline std::ostream& operator<<(std::ostream& os, const device_info& info) {
    os << "device_info{"
       << "name=\"" << info.name << "\", "
       << "id=\"" << info.id << "\", "
       << "default=" << (info.is_default ? "true" : "false") << ", "
       << "source=" << to_string(info.source) << ", "
       << "channels=" << static_cast<int>(info.format.channels) << ", "
       << "sample_rate=" << info.format.rate << ", "
       << "encoding=" << info.format.encoding
       << "}";
    return os;
}

/**
 * @struct capture_callbacks
 * @brief Entry points a backend stream calls into
 *
 * on_data runs on the backend's real-time thread with raw interleaved frames
 * in the device's native format. on_failure may run on any backend thread.
 */
struct capture_callbacks {
    void (*on_data)(void* userdata, const uint8_t* data, std::size_t bytes) = nullptr;
    void (*on_failure)(void* userdata) = nullptr;
    void* userdata = nullptr;
};

/**
 * @class capture_stream
 * @brief An open hardware capture stream
 * @ingroup backends
 *
 * Created paused by capture_backend::open_stream(). Destroying the object
 * closes the stream; once the destructor returns no callback is running and
 * none will be made, so buffers referenced by the callbacks may be freed.
 */
class AUDIOTAP_SDK_EXPORT capture_stream {
public:
    virtual ~capture_stream() = default;

    /**
     * Start delivering data to on_data.
     * @throws stream_error if the device cannot be started
     */
    virtual void resume() = 0;

    /**
     * @return true once the backend reported a runtime error (device lost)
     */
    virtual bool has_failed() const = 0;

    /**
     * @return The format the stream delivers
     */
    virtual const stream_format& format() const = 0;
};

/**
 * @class capture_backend
 * @brief Abstract interface for platform audio capture subsystems
 * @ingroup backends
 *
 * Hides device discovery and stream plumbing of the platform audio API.
 *
 * ## Thread Safety
 *
 * - init()/shutdown() must be called from the main thread
 * - Device queries and open_stream() may be called from any thread after init()
 * - Stream callbacks run on platform-specific threads
 */
class AUDIOTAP_SDK_EXPORT capture_backend {
public:
    virtual ~capture_backend() = default;

    /**
     * Initialize the audio subsystem.
     * @throws device_error if initialization fails
     */
    virtual void init() = 0;

    /**
     * Shutdown the audio subsystem.
     */
    virtual void shutdown() = 0;

    /**
     * @return Backend name (e.g. "SDL3", "Mock")
     */
    virtual std::string get_name() const = 0;

    virtual bool is_initialized() const = 0;

    /**
     * Enumerate capture devices of one source kind.
     */
    virtual std::vector<device_info> enumerate_devices(capture_source source) = 0;

    /**
     * Resolve a device request.
     * @param device_id "default" (or empty), a backend id, or an exact device name
     * @throws device_error if no matching device exists
     */
    virtual device_info resolve_device(const std::string& device_id, capture_source source) = 0;

    /**
     * Open a paused stream on a resolved device in its native format.
     * @throws format_error if the device format cannot be delivered
     * @throws stream_error if the stream cannot be opened
     */
    virtual std::unique_ptr<capture_stream> open_stream(const device_info& device,
                                                        const capture_callbacks& callbacks) = 0;

    /**
     * Process pending platform events (device hot-plug).
     * Hosts call this periodically from their main loop.
     */
    virtual void pump_events() {}
};

} // namespace audiotap

#endif // AUDIOTAP_SDK_CAPTURE_BACKEND_HH

/**
 * @file sdl3_backend_impl.hh
 * @brief SDL3 backend implementation
 * @ingroup sdl3_backend
 */

#ifndef AUDIOTAP_SDL3_BACKEND_IMPL_HH
#define AUDIOTAP_SDL3_BACKEND_IMPL_HH

#include <audiotap/sdk/capture_backend.hh>
#include "sdl3.hh"
#include <optional>
#include <string>
#include <vector>

namespace audiotap {

/**
 * @class sdl3_backend
 * @brief SDL3 implementation of the capture backend interface
 * @ingroup sdl3_backend
 *
 * Device ids are SDL's physical recording device ids in decimal, or
 * "default" for SDL's default recording device.
 *
 * @note This is an internal implementation class. Users should
 *       create instances via create_sdl3_backend().
 */
class sdl3_backend : public capture_backend {
private:
    bool m_initialized = false;

    struct sdl_device {
        SDL_AudioDeviceID id = 0;
        std::string name;
        SDL_AudioSpec spec{};
    };

    std::vector<sdl_device> recording_devices() const;
    std::string default_device_name(bool playback) const;

    static bool is_monitor(const std::string& name);
    static std::optional<stream_format> to_stream_format(const SDL_AudioSpec& spec);
    static device_info make_info(const sdl_device& dev, capture_source source, bool is_default);

    void check_initialized() const;

public:
    sdl3_backend() = default;
    ~sdl3_backend() override;

    void init() override;
    void shutdown() override;
    std::string get_name() const override;
    bool is_initialized() const override;

    std::vector<device_info> enumerate_devices(capture_source source) override;
    device_info resolve_device(const std::string& device_id, capture_source source) override;

    std::unique_ptr<capture_stream> open_stream(const device_info& device,
                                                const capture_callbacks& callbacks) override;

    void pump_events() override;
};

} // namespace audiotap

#endif // AUDIOTAP_SDL3_BACKEND_IMPL_HH

#include "sdl3_backend_impl.hh"
#include "sdl3_capture_stream.hh"
#include <audiotap/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace audiotap {
    // Anonymous namespace for helper functions
    namespace {
        constexpr const char* MONITOR_PREFIX = "Monitor of ";

        bool is_default_request(const std::string& device_id) {
            return device_id.empty() || device_id == "default";
        }

        // Decimal SDL device id, 0 if the text is not one
        SDL_AudioDeviceID parse_device_id(const std::string& device_id) {
            if (device_id.empty()) {
                return 0;
            }
            char* end = nullptr;
            errno = 0;
            const unsigned long value = std::strtoul(device_id.c_str(), &end, 10);
            if (errno != 0 || end == device_id.c_str() || *end != '\0') {
                return 0;
            }
            return static_cast<SDL_AudioDeviceID>(value);
        }
    }

    bool sdl3_backend::is_monitor(const std::string& name) {
        return name.rfind(MONITOR_PREFIX, 0) == 0;
    }

    std::optional<stream_format> sdl3_backend::to_stream_format(const SDL_AudioSpec& spec) {
        if (spec.freq <= 0 || spec.channels <= 0 || spec.channels > 255) {
            return std::nullopt;
        }
        stream_format fmt;
        fmt.rate = static_cast<sample_rate_t>(spec.freq);
        fmt.channels = static_cast<channels_t>(spec.channels);
        // Everything except native 16-bit is converted to float by SDL
        fmt.encoding = (spec.format == SDL_AUDIO_S16) ? sample_encoding::s16 : sample_encoding::f32;
        return fmt;
    }

    device_info sdl3_backend::make_info(const sdl_device& dev, capture_source source, bool is_default) {
        device_info info;
        info.name = dev.name;
        info.id = std::to_string(dev.id);
        info.is_default = is_default;
        info.source = source;
        if (auto fmt = to_stream_format(dev.spec)) {
            info.format = *fmt;
        }
        return info;
    }

    sdl3_backend::~sdl3_backend() {
        if (m_initialized) {
            shutdown();
        }
    }

    void sdl3_backend::init() {
        if (m_initialized) {
            THROW_RUNTIME("SDL3 backend already initialized");
        }

        // PulseAudio/PipeWire monitors are the loopback sources
        SDL_SetHint(SDL_HINT_AUDIO_INCLUDE_MONITORS, "1");

        if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
            throw device_error("Failed to initialize SDL3 audio: " + get_sdl_error());
        }

        m_initialized = true;
        const char* driver = SDL_GetCurrentAudioDriver();
        LOG_INFO("sdl3_backend", "Initialized with driver", driver ? driver : "none");
    }

    void sdl3_backend::shutdown() {
        if (!m_initialized) {
            return;
        }
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_initialized = false;
        LOG_INFO("sdl3_backend", "Shut down");
    }

    std::string sdl3_backend::get_name() const {
        return "SDL3";
    }

    bool sdl3_backend::is_initialized() const {
        return m_initialized;
    }

    void sdl3_backend::check_initialized() const {
        if (!m_initialized) {
            throw device_error("SDL3 backend not initialized");
        }
    }

    std::vector<sdl3_backend::sdl_device> sdl3_backend::recording_devices() const {
        std::vector<sdl_device> result;

        int count = 0;
        SDL_AudioDeviceID* ids = SDL_GetAudioRecordingDevices(&count);
        if (!ids) {
            LOG_WARN("sdl3_backend", "Cannot list recording devices:", get_sdl_error());
            return result;
        }

        for (std::size_t i = 0; i < static_cast<std::size_t>(count); i++) {
            const char* name = SDL_GetAudioDeviceName(ids[i]);
            if (!name) continue;

            sdl_device dev;
            dev.id = ids[i];
            dev.name = name;
            if (!SDL_GetAudioDeviceFormat(ids[i], &dev.spec, nullptr)) {
                LOG_DEBUG("sdl3_backend", "Skipping", dev.name, ":", get_sdl_error());
                continue;
            }
            result.push_back(std::move(dev));
        }
        SDL_free(ids);
        return result;
    }

    std::string sdl3_backend::default_device_name(bool playback) const {
        const char* name = SDL_GetAudioDeviceName(playback ? SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK
                                                           : SDL_AUDIO_DEVICE_DEFAULT_RECORDING);
        return name ? name : "";
    }

    std::vector<device_info> sdl3_backend::enumerate_devices(capture_source source) {
        check_initialized();

        const bool loopback = source == capture_source::loopback;
        const std::string default_name = loopback
            ? std::string(MONITOR_PREFIX) + default_device_name(true)
            : default_device_name(false);

        std::vector<device_info> devices;
        for (const auto& dev : recording_devices()) {
            if (is_monitor(dev.name) != loopback) {
                continue;
            }
            devices.push_back(make_info(dev, source, !default_name.empty() && dev.name == default_name));
        }

        // Default first
        std::stable_partition(devices.begin(), devices.end(),
                              [](const device_info& d) { return d.is_default; });
        return devices;
    }

    device_info sdl3_backend::resolve_device(const std::string& device_id, capture_source source) {
        check_initialized();

        if (is_default_request(device_id)) {
            if (source == capture_source::input) {
                SDL_AudioSpec spec;
                SDL_zero(spec);
                if (!SDL_GetAudioDeviceFormat(SDL_AUDIO_DEVICE_DEFAULT_RECORDING, &spec, nullptr)) {
                    throw device_error("No default recording device: " + get_sdl_error());
                }
                sdl_device dev;
                dev.id = SDL_AUDIO_DEVICE_DEFAULT_RECORDING;
                dev.name = default_device_name(false);
                dev.spec = spec;
                auto info = make_info(dev, source, true);
                info.id = "default";
                if (info.name.empty()) {
                    info.name = "default";
                }
                return info;
            }

            auto monitors = enumerate_devices(capture_source::loopback);
            if (monitors.empty()) {
                throw device_error("No loopback source found; monitor devices need PulseAudio or PipeWire");
            }
            if (!monitors.front().is_default) {
                LOG_WARN("sdl3_backend", "No monitor of the default output, using", monitors.front().name);
            }
            return monitors.front();
        }

        const auto numeric = parse_device_id(device_id);
        for (auto& dev : enumerate_devices(source)) {
            if ((numeric != 0 && dev.id == device_id) || dev.name == device_id) {
                return dev;
            }
        }
        throw device_error(std::string("No ") + to_string(source) + " device matches '" + device_id + "'");
    }

    std::unique_ptr<capture_stream> sdl3_backend::open_stream(const device_info& device,
                                                              const capture_callbacks& callbacks) {
        check_initialized();

        SDL_AudioDeviceID id = SDL_AUDIO_DEVICE_DEFAULT_RECORDING;
        if (!is_default_request(device.id)) {
            id = parse_device_id(device.id);
            if (id == 0) {
                throw device_error("Invalid SDL3 device id '" + device.id + "'");
            }
        }
        if (device.format.rate == 0 || device.format.channels == 0) {
            throw format_error("Device " + device.name + " reports no usable format");
        }
        return std::make_unique<sdl3_capture_stream>(id, device.format, callbacks);
    }

    void sdl3_backend::pump_events() {
        if (m_initialized) {
            SDL_PumpEvents();
        }
    }

} // namespace audiotap

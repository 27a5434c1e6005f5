#include "sdl3_capture_stream.hh"
#include <audiotap/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

namespace audiotap {

namespace {
    constexpr std::size_t BUFFER_FRAMES = 4096;

    SDL_AudioFormat to_sdl_format(sample_encoding enc) {
        switch (enc) {
            case sample_encoding::s16: return SDL_AUDIO_S16;
            case sample_encoding::f32: return SDL_AUDIO_F32;
            default:                   return SDL_AUDIO_UNKNOWN;
        }
    }
}

// SDL_Quit() may already have released the stream
void sdl3_capture_stream::stream_deleter::operator()(SDL_AudioStream* stream) const {
    if (stream && SDL_WasInit(SDL_INIT_AUDIO)) {
        SDL_DestroyAudioStream(stream);
    }
}

sdl3_capture_stream::sdl3_capture_stream(SDL_AudioDeviceID device_id, const stream_format& format,
                                         const capture_callbacks& callbacks)
    : m_format(format)
    , m_callbacks(callbacks)
    , m_buffer(BUFFER_FRAMES * bytes_per_frame(format), 0)
    , m_requested_id(device_id) {

    SDL_AudioSpec spec;
    SDL_zero(spec);
    spec.format = to_sdl_format(format.encoding);
    spec.channels = static_cast<int>(format.channels);
    spec.freq = static_cast<int>(format.rate);

    if (spec.format == SDL_AUDIO_UNKNOWN) {
        throw format_error("SDL3 cannot deliver " + std::string(to_string(format.encoding)) + " samples");
    }

    // Opened paused; nothing is delivered before resume()
    m_stream.reset(SDL_OpenAudioDeviceStream(device_id, &spec, &sdl3_capture_stream::sdl_callback, this));
    if (!m_stream) {
        throw stream_error("Failed to open SDL3 recording stream: " + get_sdl_error());
    }
    m_logical_id = SDL_GetAudioStreamDevice(m_stream.get());

    m_watching = SDL_AddEventWatch(&sdl3_capture_stream::event_watch, this);
    if (!m_watching) {
        LOG_WARN("sdl3_backend", "Device removal will not be detected:", get_sdl_error());
    }
}

sdl3_capture_stream::~sdl3_capture_stream() {
    if (m_watching) {
        SDL_RemoveEventWatch(&sdl3_capture_stream::event_watch, this);
    }
    // Blocks until a running callback returns
    m_stream.reset();
}

void sdl3_capture_stream::resume() {
    if (!SDL_ResumeAudioStreamDevice(m_stream.get())) {
        throw stream_error("Failed to start SDL3 recording: " + get_sdl_error());
    }
}

bool sdl3_capture_stream::has_failed() const {
    return m_failed.load(std::memory_order_acquire);
}

const stream_format& sdl3_capture_stream::format() const {
    return m_format;
}

void sdl3_capture_stream::sdl_callback(void* userdata, SDL_AudioStream* stream,
                                       int additional_amount, [[maybe_unused]] int total_amount) {
    auto* self = static_cast<sdl3_capture_stream*>(userdata);
    if (!self || !self->m_callbacks.on_data) {
        return;
    }

    const int capacity = static_cast<int>(self->m_buffer.size());
    int remaining = additional_amount;
    while (remaining > 0) {
        const int got = SDL_GetAudioStreamData(stream, self->m_buffer.data(), std::min(remaining, capacity));
        if (got <= 0) {
            break;
        }
        self->m_callbacks.on_data(self->m_callbacks.userdata, self->m_buffer.data(),
                                  static_cast<std::size_t>(got));
        remaining -= got;
    }
}

bool sdl3_capture_stream::event_watch(void* userdata, SDL_Event* event) {
    auto* self = static_cast<sdl3_capture_stream*>(userdata);
    if (!self || !event || event->type != SDL_EVENT_AUDIO_DEVICE_REMOVED) {
        return true;
    }
    const auto which = event->adevice.which;
    if (which == self->m_logical_id || which == self->m_requested_id) {
        self->mark_failed("device removed");
    }
    return true;
}

void sdl3_capture_stream::mark_failed(const char* reason) {
    if (m_failed.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    LOG_ERROR("sdl3_backend", "Capture stream failed:", reason);
    if (m_callbacks.on_failure) {
        m_callbacks.on_failure(m_callbacks.userdata);
    }
}

} // namespace audiotap

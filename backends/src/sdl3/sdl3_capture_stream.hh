#ifndef AUDIOTAP_SDL3_CAPTURE_STREAM_HH
#define AUDIOTAP_SDL3_CAPTURE_STREAM_HH

#include <audiotap/sdk/capture_backend.hh>
#include "sdl3.hh"
#include <atomic>
#include <memory>
#include <vector>

namespace audiotap {

/**
 * Recording stream opened with SDL_OpenAudioDeviceStream. SDL calls
 * sdl_callback() on its device thread whenever captured data is queued; the
 * callback drains the stream into a preallocated buffer and forwards it.
 */
class sdl3_capture_stream : public capture_stream {
public:
    /**
     * @throws format_error if the format has no SDL equivalent
     * @throws stream_error if SDL cannot open the device
     */
    sdl3_capture_stream(SDL_AudioDeviceID device_id, const stream_format& format,
                        const capture_callbacks& callbacks);
    ~sdl3_capture_stream() override;

    void resume() override;
    bool has_failed() const override;
    const stream_format& format() const override;

private:
    struct stream_deleter {
        void operator()(SDL_AudioStream* stream) const;
    };

    static void SDLCALL sdl_callback(void* userdata, SDL_AudioStream* stream,
                                     int additional_amount, int total_amount);
    static bool SDLCALL event_watch(void* userdata, SDL_Event* event);

    void mark_failed(const char* reason);

    stream_format m_format;
    capture_callbacks m_callbacks;
    std::vector<uint8_t> m_buffer;
    SDL_AudioDeviceID m_requested_id;
    SDL_AudioDeviceID m_logical_id = 0;
    std::atomic<bool> m_failed{false};
    bool m_watching = false;
    std::unique_ptr<SDL_AudioStream, stream_deleter> m_stream;
};

} // namespace audiotap

#endif // AUDIOTAP_SDL3_CAPTURE_STREAM_HH

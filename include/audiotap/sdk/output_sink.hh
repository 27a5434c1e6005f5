/**
 * @file output_sink.hh
 * @brief Consumer interface for converted audio chunks
 * @ingroup sdk
 */

#ifndef AUDIOTAP_SDK_OUTPUT_SINK_HH
#define AUDIOTAP_SDK_OUTPUT_SINK_HH

#include <audiotap/sdk/types.hh>
#include <audiotap/sdk/export_audiotap_sdk.h>

namespace audiotap {

/**
 * @class output_sink
 * @brief Receives 16-bit mono PCM chunks produced by a capture session
 * @ingroup sdk
 *
 * The sink is bound to a session when the session is constructed. Every
 * successful conversion cycle calls on_chunk() exactly once, in delivery
 * order, on the audio callback thread.
 *
 * ## Implementation Requirements
 *
 * - on_chunk() must not block, lock or allocate. The samples are only valid
 *   for the duration of the call; copy them to keep them.
 * - Hand the data to a non-blocking mechanism (see chunk_broadcaster).
 */
class AUDIOTAP_SDK_EXPORT output_sink {
public:
    virtual ~output_sink() = default;

    /**
     * @param samples Signed 16-bit samples at the target rate
     * @param count Number of samples, never more than the configured chunk size
     */
    virtual void on_chunk(const int16_t* samples, std::size_t count) = 0;

    /**
     * Called once when the backend reports that the open stream has ended
     * with an error. May run on any backend thread, including the one
     * that delivers SDL device events, so it must not block.
     */
    virtual void on_stream_failed() {}
};

} // namespace audiotap

#endif // AUDIOTAP_SDK_OUTPUT_SINK_HH

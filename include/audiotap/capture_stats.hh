#ifndef AUDIOTAP_CAPTURE_STATS_HH
#define AUDIOTAP_CAPTURE_STATS_HH

#include <cstdint>
#include <ostream>

namespace audiotap {
    /**
     * @struct capture_stats
     * @brief Counters of one capture stream
     *
     * Snapshot taken with relaxed loads; the fields are individually exact but
     * not mutually consistent while the stream is running.
     */
    struct capture_stats {
        uint64_t frames_received = 0;   ///< Device frames handed to the pipeline
        uint64_t samples_dropped = 0;   ///< Mono samples lost to ring buffer overrun
        uint64_t conversions = 0;       ///< Resampler blocks processed
        uint64_t chunks_emitted = 0;    ///< Chunks handed to the sink
        uint64_t samples_emitted = 0;   ///< PCM samples handed to the sink
    };

    inline std::ostream& operator<<(std::ostream& os, const capture_stats& s) {
        os << "capture_stats{"
           << "frames_received=" << s.frames_received << ", "
           << "samples_dropped=" << s.samples_dropped << ", "
           << "conversions=" << s.conversions << ", "
           << "chunks_emitted=" << s.chunks_emitted << ", "
           << "samples_emitted=" << s.samples_emitted
           << "}";
        return os;
    }
}

#endif

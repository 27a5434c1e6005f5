// Whole audio callback: device bytes to PCM chunks
#include <nanobench.h>
#include "../benchmark_helpers.hh"
#include <audiotap/capture_config.hh>
#include "../../src/audiotap/capture_pipeline.hh"
#include <vector>

namespace audiotap::benchmark {

void register_pipeline_benchmarks(ankerl::nanobench::Bench& bench) {
    capture_config cfg;

    // Typical PulseAudio/PipeWire period sizes at 48 kHz
    for (std::size_t frames : {256u, 480u, 1024u}) {
        null_sink sink;
        capture_pipeline pipeline({48000, 2, sample_encoding::s16}, cfg, &sink);
        const auto bytes = make_device_bytes_s16(frames, 2, 48000.0f);

        bench.run("capture_pipeline::process " + std::to_string(frames) + " frames s16 stereo", [&] {
            pipeline.process(bytes.data(), bytes.size());
        });
        ankerl::nanobench::doNotOptimizeAway(sink.checksum);
    }
}

} // namespace audiotap::benchmark

// Building blocks of the audio callback
#include <nanobench.h>
#include "../benchmark_helpers.hh"
#include <audiotap/sdk/downmix.hh>
#include <audiotap/sdk/fft_resampler.hh>
#include <audiotap/sdk/pcm.hh>
#include <audiotap/sdk/ring_buffer.hh>
#include <audiotap/sdk/sample_format.hh>
#include <vector>

namespace audiotap::benchmark {

void register_dsp_benchmarks(ankerl::nanobench::Bench& bench) {
    // One resampler block per iteration
    for (sample_rate_t rate : {48000u, 44100u, 16000u}) {
        fft_resampler r(rate, 16000, 1024);
        auto in = make_float_block(r.input_block_length());
        std::vector<float> out(r.output_block_length());

        bench.run("fft_resampler::convert " + std::to_string(rate) + " -> 16000", [&] {
            auto n = r.convert(in.data(), out.data());
            ankerl::nanobench::doNotOptimizeAway(n);
        });
    }

    {
        ring_buffer rb(4 * 3072);
        auto in = make_float_block(480);
        std::vector<float> out(480);
        bench.run("ring_buffer push+pop 480", [&] {
            rb.push(in.data(), in.size());
            auto n = rb.pop_into(out.data(), out.size());
            ankerl::nanobench::doNotOptimizeAway(n);
        });
    }

    {
        const auto bytes = make_device_bytes_s16(480, 2, 48000.0f);
        std::vector<float> scratch(960);
        auto to_float = get_to_float_converter(sample_encoding::s16);
        bench.run("s16 stereo decode+downmix 480 frames", [&] {
            to_float(scratch.data(), bytes.data(), 960);
            downmix(scratch.data(), scratch.data(), 480, 2);
            ankerl::nanobench::doNotOptimizeAway(scratch[0]);
        });
    }

    {
        auto in = make_float_block(1024);
        std::vector<int16_t> out(1024);
        bench.run("float_to_s16 1024", [&] {
            float_to_s16(out.data(), in.data(), in.size());
            ankerl::nanobench::doNotOptimizeAway(out[0]);
        });
    }
}

} // namespace audiotap::benchmark

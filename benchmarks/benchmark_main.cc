#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>
#include <iostream>

// Declare benchmark suites
namespace audiotap::benchmark {
    void register_dsp_benchmarks(ankerl::nanobench::Bench& bench);
    void register_pipeline_benchmarks(ankerl::nanobench::Bench& bench);
    void register_broadcaster_benchmarks(ankerl::nanobench::Bench& bench);
}

int main() {
    std::cout << "Running audiotap benchmarks...\n\n";

    {
        ankerl::nanobench::Bench bench;
        bench.title("audiotap capture path");
        bench.relative(true);
        bench.performanceCounters(true);

        audiotap::benchmark::register_dsp_benchmarks(bench);
        audiotap::benchmark::register_pipeline_benchmarks(bench);
        audiotap::benchmark::register_broadcaster_benchmarks(bench);
    }

    return 0;
}

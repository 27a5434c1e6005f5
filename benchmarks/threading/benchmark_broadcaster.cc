// Hand-off from the audio thread to subscribers
#include <nanobench.h>
#include <audiotap/chunk_broadcaster.hh>
#include <atomic>
#include <thread>
#include <vector>

namespace audiotap::benchmark {

void register_broadcaster_benchmarks(ankerl::nanobench::Bench& bench) {
    const std::vector<int16_t> chunk(1024, 1234);

    {
        chunk_broadcaster b(1024, 64);
        uint64_t seen = 0;
        b.subscribe([&](const std::vector<int16_t>& c) { seen += c.size(); });
        bench.run("chunk_broadcaster on_chunk+dispatch, 1 subscriber", [&] {
            b.on_chunk(chunk.data(), chunk.size());
            b.dispatch();
        });
        ankerl::nanobench::doNotOptimizeAway(seen);
    }

    {
        chunk_broadcaster b(1024, 64);
        std::atomic<bool> stop{false};
        std::thread consumer([&] {
            while (!stop) {
                if (b.dispatch() == 0) {
                    std::this_thread::yield();
                }
            }
        });
        bench.run("chunk_broadcaster on_chunk with concurrent dispatch", [&] {
            b.on_chunk(chunk.data(), chunk.size());
        });
        stop = true;
        consumer.join();
    }
}

} // namespace audiotap::benchmark

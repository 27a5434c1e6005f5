#include <doctest/doctest.h>
#include <audiotap/chunk_broadcaster.hh>
#include <audiotap/error.hh>
#include <atomic>
#include <thread>
#include <vector>

using namespace audiotap;

namespace {
    std::vector<int16_t> chunk_of(int16_t value, std::size_t n = 4) {
        return std::vector<int16_t>(n, value);
    }

    void push(chunk_broadcaster& b, const std::vector<int16_t>& c) {
        b.on_chunk(c.data(), c.size());
    }
}

TEST_SUITE("ChunkBroadcaster::Unit") {

    TEST_CASE("should_validate_sizes") {
        CHECK_THROWS_AS(chunk_broadcaster(0), config_error);
        CHECK_THROWS_AS(chunk_broadcaster(1024, 0), config_error);
        chunk_broadcaster b(1024);
        CHECK_THROWS_AS(b.subscribe(nullptr), config_error);
    }

    TEST_CASE("should_deliver_chunks_in_order_to_every_subscriber") {
        chunk_broadcaster b(16);
        std::vector<std::vector<int16_t>> first;
        std::vector<std::vector<int16_t>> second;
        b.subscribe([&](const std::vector<int16_t>& c) { first.push_back(c); });
        b.subscribe([&](const std::vector<int16_t>& c) { second.push_back(c); });
        CHECK(b.subscriber_count() == 2);

        push(b, chunk_of(1));
        push(b, chunk_of(2, 3));
        push(b, chunk_of(3));
        CHECK(b.pending() == 3);

        CHECK(b.dispatch() == 3);
        CHECK(b.pending() == 0);

        REQUIRE(first.size() == 3);
        CHECK(first[0] == chunk_of(1));
        CHECK(first[1] == chunk_of(2, 3));
        CHECK(first[2] == chunk_of(3));
        CHECK(second == first);

        // Nothing new
        CHECK(b.dispatch() == 0);
    }

    TEST_CASE("should_stop_delivering_after_unsubscribe") {
        chunk_broadcaster b(4);
        int calls = 0;
        auto id = b.subscribe([&](const std::vector<int16_t>&) { calls++; });

        push(b, chunk_of(1));
        b.dispatch();
        CHECK(calls == 1);

        b.unsubscribe(id);
        CHECK(b.subscriber_count() == 0);
        // Unknown ids are ignored
        CHECK_NOTHROW(b.unsubscribe(id));
        CHECK_NOTHROW(b.unsubscribe(9999));

        push(b, chunk_of(2));
        CHECK(b.dispatch() == 1);
        CHECK(calls == 1);
    }

    TEST_CASE("should_drop_chunks_when_slots_are_full") {
        chunk_broadcaster b(4, 2);
        std::vector<int16_t> seen;
        b.subscribe([&](const std::vector<int16_t>& c) { seen.push_back(c[0]); });

        push(b, chunk_of(1));
        push(b, chunk_of(2));
        push(b, chunk_of(3));

        CHECK(b.pending() == 2);
        CHECK(b.dropped_chunks() == 1);

        b.dispatch();
        CHECK(seen == std::vector<int16_t>{1, 2});

        // Slots are free again
        push(b, chunk_of(4));
        b.dispatch();
        CHECK(seen == std::vector<int16_t>{1, 2, 4});
        CHECK(b.dropped_chunks() == 1);
    }

    TEST_CASE("should_truncate_oversized_chunks") {
        chunk_broadcaster b(4);
        std::size_t size = 0;
        b.subscribe([&](const std::vector<int16_t>& c) { size = c.size(); });
        push(b, chunk_of(7, 10));
        b.dispatch();
        CHECK(size == 4);
    }

    TEST_CASE("should_record_stream_failure") {
        chunk_broadcaster b(4);
        CHECK_FALSE(b.stream_failed());
        b.on_stream_failed();
        CHECK(b.stream_failed());
    }

    TEST_CASE("should_hand_off_between_threads") {
        constexpr int total = 5000;
        chunk_broadcaster b(8, 16);
        std::vector<int16_t> seen;
        b.subscribe([&](const std::vector<int16_t>& c) { seen.push_back(c[0]); });

        std::atomic<bool> done{false};
        std::thread producer([&] {
            for (int i = 0; i < total; i++) {
                const auto c = chunk_of(static_cast<int16_t>(i % 30000), 8);
                // Wait for a free slot instead of dropping
                while (b.pending() >= 16) {
                    std::this_thread::yield();
                }
                b.on_chunk(c.data(), c.size());
            }
            done = true;
        });

        while (!done || b.pending() > 0) {
            b.dispatch();
        }
        producer.join();
        b.dispatch();

        REQUIRE(seen.size() == static_cast<std::size_t>(total));
        CHECK(b.dropped_chunks() == 0);
        bool ordered = true;
        for (int i = 0; i < total; i++) {
            if (seen[static_cast<std::size_t>(i)] != static_cast<int16_t>(i % 30000)) {
                ordered = false;
            }
        }
        CHECK(ordered);
    }
}

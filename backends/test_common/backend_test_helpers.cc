#include "backend_test_helpers.hh"
#include <audiotap/error.hh>
#include <doctest/doctest.h>
#include <atomic>
#include <chrono>
#include <thread>

namespace audiotap::test {

namespace {
    struct counting_target {
        std::atomic<std::size_t> bytes{0};
        std::atomic<int> failures{0};

        capture_callbacks callbacks() {
            capture_callbacks cb;
            cb.on_data = [](void* ud, const uint8_t*, std::size_t n) {
                static_cast<counting_target*>(ud)->bytes += n;
            };
            cb.on_failure = [](void* ud) {
                static_cast<counting_target*>(ud)->failures++;
            };
            cb.userdata = this;
            return cb;
        }
    };
}

void test_backend_initialization(std::unique_ptr<capture_backend> backend) {
    REQUIRE(backend != nullptr);

    CHECK_FALSE(backend->is_initialized());

    CHECK_NOTHROW(backend->init());
    CHECK(backend->is_initialized());

    // Double init should throw
    CHECK_THROWS_AS(backend->init(), std::runtime_error);

    CHECK_NOTHROW(backend->shutdown());
    CHECK_FALSE(backend->is_initialized());

    // Double shutdown should be safe
    CHECK_NOTHROW(backend->shutdown());
}

void test_device_enumeration(std::unique_ptr<capture_backend> backend) {
    REQUIRE(backend != nullptr);
    backend->init();

    for (auto source : {capture_source::input, capture_source::loopback}) {
        auto devices = backend->enumerate_devices(source);
        for (const auto& dev : devices) {
            CHECK(dev.source == source);
            CHECK_FALSE(dev.id.empty());
            CHECK(dev.format.rate > 0);
            CHECK(dev.format.channels > 0);
        }
        // At most one default, listed first
        std::size_t defaults = 0;
        for (std::size_t i = 0; i < devices.size(); i++) {
            if (devices[i].is_default) {
                defaults++;
                CHECK(i == 0);
            }
        }
        CHECK(defaults <= 1);
    }

    backend->shutdown();
}

void test_stream_open_close(std::unique_ptr<capture_backend> backend) {
    REQUIRE(backend != nullptr);
    backend->init();

    device_info dev;
    try {
        dev = backend->resolve_device("default", capture_source::input);
    } catch (const device_error& e) {
        MESSAGE("No input device, skipping: " << e.what());
        backend->shutdown();
        return;
    }
    CHECK(dev.source == capture_source::input);
    CHECK(dev.format.rate > 0);

    counting_target target;
    {
        auto stream = backend->open_stream(dev, target.callbacks());
        REQUIRE(stream != nullptr);
        CHECK(stream->format().rate == dev.format.rate);
        CHECK(stream->format().channels == dev.format.channels);
        CHECK_FALSE(stream->has_failed());

        CHECK_NOTHROW(stream->resume());
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    // No callbacks once the stream is gone
    const auto bytes_after_close = target.bytes.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CHECK(target.bytes.load() == bytes_after_close);
    CHECK(target.failures.load() == 0);

    backend->shutdown();
}

void test_error_conditions(std::unique_ptr<capture_backend> backend) {
    REQUIRE(backend != nullptr);

    // Should throw before init
    CHECK_THROWS_AS(backend->enumerate_devices(capture_source::input), device_error);
    CHECK_THROWS_AS(backend->resolve_device("default", capture_source::input), device_error);

    backend->init();
    CHECK_THROWS_AS(backend->resolve_device("no such device 4f1c", capture_source::input), device_error);
    CHECK_THROWS_AS(backend->resolve_device("no such device 4f1c", capture_source::loopback), device_error);
    backend->shutdown();
}

} // namespace audiotap::test

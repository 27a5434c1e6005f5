#include <doctest/doctest.h>
#include <audiotap_backends/sdl3/sdl3_backend.hh>
#include <audiotap/sdk/capture_backend.hh>
#include "../../../test_common/backend_test_helpers.hh"
#include <cstdlib>
#include <memory>

namespace {
    // Runs without audio hardware
    struct dummy_driver {
        dummy_driver() {
            setenv("SDL_AUDIO_DRIVER", "dummy", 0);
        }
    };
    const dummy_driver s_dummy_driver;
}

TEST_SUITE("SDL3Backend") {
    TEST_CASE("SDL3 backend creation") {
        auto backend = audiotap::create_sdl3_backend();
        CHECK(backend != nullptr);
        CHECK_FALSE(backend->is_initialized());
        CHECK(backend->get_name() == "SDL3");
    }

    TEST_CASE("SDL3 initialization lifecycle") {
        audiotap::test::test_backend_initialization(audiotap::create_sdl3_backend());
    }

    TEST_CASE("SDL3 device enumeration") {
        audiotap::test::test_device_enumeration(audiotap::create_sdl3_backend());
    }

    TEST_CASE("SDL3 stream open and close") {
        audiotap::test::test_stream_open_close(audiotap::create_sdl3_backend());
    }

    TEST_CASE("SDL3 error conditions") {
        audiotap::test::test_error_conditions(audiotap::create_sdl3_backend());
    }
}

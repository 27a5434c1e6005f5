#include <doctest/doctest.h>
#include <audiotap/capture_config.hh>
#include <audiotap/error.hh>
#include <cstdlib>

using namespace audiotap;

namespace {
    struct env_guard {
        env_guard() { clear(); }
        ~env_guard() { clear(); }
        static void clear() {
            unsetenv("AUDIOTAP_DEVICE");
            unsetenv("AUDIOTAP_SOURCE");
        }
    };
}

TEST_SUITE("CaptureConfig::Unit") {

    TEST_CASE("should_default_to_16khz_loopback_chunks") {
        capture_config cfg;
        CHECK(cfg.device_id == "default");
        CHECK(cfg.source == capture_source::loopback);
        CHECK(cfg.target_rate == 16000);
        CHECK(cfg.chunk_size == 1024);
        CHECK(cfg.sub_chunks == 2);
        CHECK(cfg.ring_blocks == 4);
        CHECK(cfg.max_delivery_frames == 4096);
        CHECK(cfg.sink_slots == 64);
        CHECK_NOTHROW(cfg.validate());
    }

    TEST_CASE("should_reject_invalid_values") {
        capture_config cfg;

        SUBCASE("target_rate") { cfg.target_rate = 0; }
        SUBCASE("chunk_size") { cfg.chunk_size = 0; }
        SUBCASE("sub_chunks_zero") { cfg.sub_chunks = 0; }
        SUBCASE("sub_chunks_too_many") { cfg.sub_chunks = cfg.chunk_size + 1; }
        SUBCASE("ring_blocks") { cfg.ring_blocks = 0; }
        SUBCASE("max_delivery_frames") { cfg.max_delivery_frames = 0; }
        SUBCASE("sink_slots") { cfg.sink_slots = 1; }

        CHECK_THROWS_AS(cfg.validate(), config_error);
    }

    TEST_CASE("should_apply_environment_overrides") {
        env_guard guard;
        capture_config cfg;

        SUBCASE("unset_keeps_defaults") {
            apply_environment(cfg);
            CHECK(cfg.device_id == "default");
            CHECK(cfg.source == capture_source::loopback);
        }

        SUBCASE("empty_values_are_ignored") {
            setenv("AUDIOTAP_DEVICE", "", 1);
            setenv("AUDIOTAP_SOURCE", "", 1);
            apply_environment(cfg);
            CHECK(cfg.device_id == "default");
        }

        SUBCASE("device_and_source") {
            setenv("AUDIOTAP_DEVICE", "USB Audio", 1);
            setenv("AUDIOTAP_SOURCE", "mic", 1);
            apply_environment(cfg);
            CHECK(cfg.device_id == "USB Audio");
            CHECK(cfg.source == capture_source::input);
        }

        SUBCASE("invalid_source") {
            setenv("AUDIOTAP_SOURCE", "speakers", 1);
            CHECK_THROWS_AS(apply_environment(cfg), config_error);
        }
    }
}

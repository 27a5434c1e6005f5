/**
 * @file test_capture_end_to_end.cc
 * @brief Device bytes in, 16 kHz mono PCM chunks out
 *
 * Drives a full capture_session through the mock backend with irregular
 * delivery sizes, as a real audio thread would.
 */

#include <doctest/doctest.h>
#include <audiotap/capture_session.hh>
#include <audiotap/chunk_broadcaster.hh>
#include <audiotap/wav_writer.hh>
#include "../../mock_backends.hh"
#include "../../mock_components.hh"
#include <algorithm>
#include <cstdlib>
#include <memory>
#include <vector>

using namespace audiotap;
using namespace audiotap::test;

namespace {
    void check_one_second_output(const collecting_sink& sink) {
        const auto total = static_cast<long>(sink.total_samples());
        CHECK(total == 15360);
        CHECK(std::labs(total - 16000) <= 1024);
        for (auto n : sink.chunk_sizes()) {
            CHECK(n <= 1024);
        }
    }
}

TEST_SUITE("Integration::Capture") {

    TEST_CASE("should_convert_one_second_of_48k_stereo") {
        auto mock = create_mock_backend();
        auto sink = std::make_shared<collecting_sink>();

        SUBCASE("s16_input") {
            capture_config cfg;
            cfg.source = capture_source::input;
            capture_session session(mock, cfg, sink);
            session.start();
            REQUIRE(session.device().format.encoding == sample_encoding::s16);

            deliver_irregular(*mock->active_stream(), make_sine_s16(48000, 2, 1000.0f, 48000.0f), 2);
            session.stop();
            check_one_second_output(*sink);
        }

        SUBCASE("f32_loopback") {
            capture_session session(mock, capture_config{}, sink);
            session.start();
            REQUIRE(session.device().format.encoding == sample_encoding::f32);

            deliver_irregular(*mock->active_stream(), make_sine_f32(48000, 2, 1000.0f, 48000.0f), 2);
            session.stop();
            check_one_second_output(*sink);
        }
    }

    TEST_CASE("should_preserve_tone_level") {
        auto mock = create_mock_backend();
        auto sink = std::make_shared<collecting_sink>();
        capture_session session(mock, capture_config{}, sink);
        session.start();

        deliver_irregular(*mock->active_stream(), make_sine_f32(48000, 2, 440.0f, 48000.0f, 0.5f), 2);
        session.stop();

        const auto pcm = sink->samples();
        REQUIRE(pcm.size() > 4096);
        // Past the filter delay the peak matches the input
        const auto peak = *std::max_element(pcm.begin() + 2048, pcm.end());
        CHECK(peak == doctest::Approx(0.5 * 32767).epsilon(0.03));
    }

    TEST_CASE("should_clamp_overdriven_input") {
        auto mock = create_mock_backend();
        auto sink = std::make_shared<collecting_sink>();
        capture_session session(mock, capture_config{}, sink);
        session.start();

        // 100 Hz square wave at 1.5x full scale
        deliver_irregular(*mock->active_stream(), make_square_f32(48000, 2, 480, 1.5f), 2);
        session.stop();

        const auto pcm = sink->samples();
        REQUIRE_FALSE(pcm.empty());
        CHECK(*std::max_element(pcm.begin(), pcm.end()) == 32767);
        CHECK(*std::min_element(pcm.begin(), pcm.end()) == -32767);

        // No wraparound: clipped plateaus stay on their own side
        std::size_t pinned = 0;
        for (auto v : pcm) {
            if (v == 32767 || v == -32767) {
                pinned++;
            }
        }
        CHECK(pinned > pcm.size() / 2);
    }

    TEST_CASE("should_convert_44100_mono_device") {
        auto mock = create_mock_backend();
        auto sink = std::make_shared<collecting_sink>();
        capture_config cfg;
        cfg.source = capture_source::input;
        cfg.device_id = "mock_usb";
        capture_session session(mock, cfg, sink);
        session.start();

        deliver_irregular(*mock->active_stream(), make_sine_s16(44100, 1, 1000.0f, 44100.0f, 0.5f), 1);
        session.stop();

        CHECK(sink->total_samples() == 15360);
        for (auto n : sink->chunk_sizes()) {
            CHECK(n == 1024);
        }
    }

    TEST_CASE("should_fan_out_through_broadcaster") {
        auto mock = create_mock_backend();
        capture_config cfg;
        auto broadcaster = std::make_shared<chunk_broadcaster>(cfg.chunk_size, cfg.sink_slots);

        std::vector<int16_t> transcript;
        std::size_t recorder_chunks = 0;
        broadcaster->subscribe([&](const std::vector<int16_t>& c) {
            transcript.insert(transcript.end(), c.begin(), c.end());
        });
        broadcaster->subscribe([&](const std::vector<int16_t>&) { recorder_chunks++; });

        capture_session session(mock, cfg, broadcaster);
        session.start();
        deliver_irregular(*mock->active_stream(), make_sine_f32(48000, 2, 440.0f, 48000.0f, 0.5f), 2);

        CHECK(broadcaster->dispatch() == 15);
        session.stop();

        CHECK(transcript.size() == 15360);
        CHECK(recorder_chunks == 15);
        CHECK(broadcaster->dropped_chunks() == 0);
    }

    TEST_CASE("should_produce_wav_compatible_stream") {
        auto mock = create_mock_backend();
        auto sink = std::make_shared<collecting_sink>();
        capture_session session(mock, capture_config{}, sink);
        session.start();
        deliver_irregular(*mock->active_stream(), make_sine_f32(9600, 2, 440.0f, 48000.0f, 0.5f), 2);
        session.stop();

        const auto pcm = sink->samples();
        const auto wav = encode_wav(pcm.data(), pcm.size(), session.config().target_rate);
        CHECK(wav.size() == WAV_HEADER_SIZE + pcm.size() * 2);
    }
}

/**
 * @file test_capture_backend.cc
 * @brief Backend interface helpers and the mock backend contract
 */

#include <doctest/doctest.h>
#include <audiotap/sdk/capture_backend.hh>
#include <audiotap/error.hh>
#include "../../mock_backends.hh"
#include "../../../backends/test_common/backend_test_helpers.hh"
#include <sstream>

using namespace audiotap;
using namespace audiotap::test;

TEST_SUITE("SDK::CaptureBackend") {

    TEST_CASE("should_parse_capture_sources") {
        CHECK(parse_capture_source("input") == capture_source::input);
        CHECK(parse_capture_source("Mic") == capture_source::input);
        CHECK(parse_capture_source("MICROPHONE") == capture_source::input);
        CHECK(parse_capture_source("loopback") == capture_source::loopback);
        CHECK(parse_capture_source("Output") == capture_source::loopback);
        CHECK(parse_capture_source("system") == capture_source::loopback);

        CHECK_THROWS_AS(parse_capture_source(""), config_error);
        CHECK_THROWS_AS(parse_capture_source("speakers"), config_error);
    }

    TEST_CASE("should_name_capture_sources") {
        CHECK(std::string(to_string(capture_source::input)) == "input");
        CHECK(std::string(to_string(capture_source::loopback)) == "loopback");
        CHECK(parse_capture_source(to_string(capture_source::loopback)) == capture_source::loopback);
    }

    TEST_CASE("should_format_device_info") {
        device_info info;
        info.name = "Monitor of Speakers";
        info.id = "42";
        info.is_default = true;
        info.source = capture_source::loopback;
        info.format = {48000, 2, sample_encoding::f32};

        std::ostringstream os;
        os << info;
        CHECK(os.str() == "device_info{name=\"Monitor of Speakers\", id=\"42\", default=true, "
                          "source=loopback, channels=2, sample_rate=48000, encoding=f32}");
    }

    TEST_CASE("mock_backend_should_satisfy_backend_contract") {
        SUBCASE("initialization") {
            test_backend_initialization(std::make_unique<mock_capture_backend>());
        }
        SUBCASE("enumeration") {
            test_device_enumeration(std::make_unique<mock_capture_backend>());
        }
        SUBCASE("stream_open_close") {
            test_stream_open_close(std::make_unique<mock_capture_backend>());
        }
        SUBCASE("error_conditions") {
            test_error_conditions(std::make_unique<mock_capture_backend>());
        }
    }
}

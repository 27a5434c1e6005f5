#include <doctest/doctest.h>
#include <audiotap/sdk/endian.hh>
#include <cstring>

using namespace audiotap;

TEST_SUITE("Endian::Unit") {
    TEST_CASE("should_swap_bytes") {
        CHECK(swap16(0x1234) == 0x3412);
        CHECK(swap16(0x00FF) == 0xFF00);
        CHECK(swap32(0x12345678) == 0x78563412);
        CHECK(swap32(0xFF000000) == 0x000000FF);
    }

    TEST_CASE("should_match_detected_byte_order") {
        const uint32_t value = 0x01020304;
        uint8_t bytes[4];
        std::memcpy(bytes, &value, sizeof(value));
        CHECK((bytes[0] == 0x04) == is_little_endian);
        CHECK(is_big_endian != is_little_endian);
    }

    TEST_CASE("should_produce_little_endian_layout") {
        const uint32_t le = swap32le(0x0A0B0C0D);
        uint8_t bytes[4];
        std::memcpy(bytes, &le, sizeof(le));
        CHECK(bytes[0] == 0x0D);
        CHECK(bytes[3] == 0x0A);

        const uint16_t le16 = swap16le(0x0102);
        uint8_t b16[2];
        std::memcpy(b16, &le16, sizeof(le16));
        CHECK(b16[0] == 0x02);
        CHECK(b16[1] == 0x01);
    }
}

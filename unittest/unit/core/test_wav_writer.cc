#include <doctest/doctest.h>
#include <audiotap/wav_writer.hh>
#include <audiotap/error.hh>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace audiotap;

namespace {
    uint32_t u32_at(const std::vector<uint8_t>& b, std::size_t off) {
        return static_cast<uint32_t>(b[off]) | (static_cast<uint32_t>(b[off + 1]) << 8) |
               (static_cast<uint32_t>(b[off + 2]) << 16) | (static_cast<uint32_t>(b[off + 3]) << 24);
    }

    uint16_t u16_at(const std::vector<uint8_t>& b, std::size_t off) {
        return static_cast<uint16_t>(b[off] | (b[off + 1] << 8));
    }

    std::string tag_at(const std::vector<uint8_t>& b, std::size_t off) {
        return std::string(reinterpret_cast<const char*>(b.data() + off), 4);
    }

    std::vector<uint8_t> read_file(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::string temp_path(const char* name) {
        return (std::filesystem::temp_directory_path() / name).string();
    }
}

TEST_SUITE("WavWriter::Unit") {

    TEST_CASE("should_build_canonical_header") {
        const auto h = make_wav_header(16000, 1, 2048);
        REQUIRE(h.size() == WAV_HEADER_SIZE);
        CHECK(tag_at(h, 0) == "RIFF");
        CHECK(u32_at(h, 4) == 36 + 2048);
        CHECK(tag_at(h, 8) == "WAVE");
        CHECK(tag_at(h, 12) == "fmt ");
        CHECK(u32_at(h, 16) == 16);
        CHECK(u16_at(h, 20) == 1);
        CHECK(u16_at(h, 22) == 1);
        CHECK(u32_at(h, 24) == 16000);
        CHECK(u32_at(h, 28) == 32000);
        CHECK(u16_at(h, 32) == 2);
        CHECK(u16_at(h, 34) == 16);
        CHECK(tag_at(h, 36) == "data");
        CHECK(u32_at(h, 40) == 2048);
    }

    TEST_CASE("should_encode_in_memory") {
        const std::vector<int16_t> pcm = {0, 1, -1, 32767, -32768};
        const auto wav = encode_wav(pcm.data(), pcm.size(), 16000);
        REQUIRE(wav.size() == WAV_HEADER_SIZE + 10);
        CHECK(u32_at(wav, 40) == 10);
        CHECK(static_cast<int16_t>(u16_at(wav, 44 + 2 * 2)) == -1);
        CHECK(static_cast<int16_t>(u16_at(wav, 44 + 4 * 2)) == -32768);

        const auto empty = encode_wav(nullptr, 0, 16000);
        CHECK(empty.size() == WAV_HEADER_SIZE);
    }

    TEST_CASE("should_patch_sizes_on_close") {
        const auto path = temp_path("audiotap_test_writer.wav");
        std::vector<int16_t> chunk(1024);
        for (std::size_t i = 0; i < chunk.size(); i++) {
            chunk[i] = static_cast<int16_t>(i);
        }

        {
            wav_writer w(path, 16000);
            CHECK(w.is_open());
            w.write(chunk);
            w.write(chunk.data(), 500);
            CHECK(w.samples_written() == 1524);
            w.close();
            CHECK_FALSE(w.is_open());
            CHECK_THROWS_AS(w.write(chunk), io_error);
        }

        const auto bytes = read_file(path);
        REQUIRE(bytes.size() == WAV_HEADER_SIZE + 1524 * 2);
        CHECK(u32_at(bytes, 4) == 36 + 1524 * 2);
        CHECK(u32_at(bytes, 40) == 1524 * 2);
        CHECK(u16_at(bytes, 44 + 1023 * 2) == 1023);
        std::remove(path.c_str());
    }

    TEST_CASE("should_finalize_on_destruction") {
        const auto path = temp_path("audiotap_test_writer_dtor.wav");
        {
            wav_writer w(path, 16000);
            w.write(std::vector<int16_t>(100, 5));
        }
        const auto bytes = read_file(path);
        REQUIRE(bytes.size() == WAV_HEADER_SIZE + 200);
        CHECK(u32_at(bytes, 40) == 200);
        std::remove(path.c_str());
    }

    TEST_CASE("should_report_io_failures") {
        CHECK_THROWS_AS(wav_writer("/nonexistent-dir/x/out.wav", 16000), io_error);
        CHECK_THROWS_AS(wav_writer(temp_path("audiotap_bad.wav"), 0), config_error);
    }
}

//
// Byte cursor, writer and CRC helpers used by the chunk codec
//

#include <doctest/doctest.h>
#include <vector>
#include <string>
#include <cstring>

#include <pngchunk/exceptions.hh>
#include <pngchunk/chunk_type.hh>
#include "../src/libpngchunk/input.hh"
#include "../src/libpngchunk/output.hh"
#include "../src/libpngchunk/crc.hh"
#include "test_utils.hh"

using namespace pngchunk;

TEST_SUITE("BYTE_IO") {
    TEST_CASE("byte_reader") {
        auto data = to_bytes("\x12\x34\x56\x78IHDRtail");

        SUBCASE("big-endian integers and chunk types") {
            byte_reader in(data.data(), data.size());
            CHECK(in.read_u32be() == 0x12345678u);
            CHECK(in.read_chunk_type() == chunk_id::IHDR);
            CHECK(in.tell() == 8);
            CHECK(in.remaining() == 4);
        }

        SUBCASE("short read returns what is left") {
            byte_reader in(data.data(), data.size());
            in.seek(10);
            char buf[8] = {};
            CHECK(in.read(buf, sizeof(buf)) == 2);
            CHECK(std::string(buf, 2) == "il");
            CHECK(in.at_end());
            CHECK(in.read(buf, sizeof(buf)) == 0);
        }

        SUBCASE("exact reads throw past the end") {
            byte_reader in(data.data(), data.size());
            in.skip(8);
            CHECK_THROWS_AS(in.read_exact(5), io_error);
        }

        SUBCASE("integer read past the end throws") {
            byte_reader in(data.data(), data.size());
            in.skip(10);
            CHECK_THROWS_AS(in.read_u32be(), io_error);
        }

        SUBCASE("seek and skip are bounded") {
            byte_reader in(data.data(), data.size());
            CHECK_THROWS_AS(in.seek(13), io_error);
            CHECK_THROWS_AS(in.skip(13), io_error);
            CHECK_NOTHROW(in.seek(12));
            CHECK(in.at_end());
        }

        SUBCASE("empty buffer") {
            byte_reader in(nullptr, 0);
            CHECK(in.at_end());
            CHECK(in.remaining() == 0);
        }
    }

    TEST_CASE("byte_writer") {
        std::vector<std::byte> out;
        byte_writer w(out);
        w.write_u32be(0x0000000Du);
        w.write_chunk_type(chunk_id::IHDR);
        w.write("ab", 2);
        w.write(nullptr, 0);

        CHECK(w.tell() == 10);
        CHECK(out == to_bytes(std::string("\x00\x00\x00\x0DIHDRab", 10)));
    }

    TEST_CASE("crc32") {
        SUBCASE("check value") {
            const char* check = "123456789";
            CHECK(crc32_update(0, check, std::strlen(check)) == 0xCBF43926u);
        }

        SUBCASE("incremental equals one shot") {
            std::string text = "IEND";
            std::uint32_t whole = crc32_update(0, text.data(), text.size());
            std::uint32_t parts = crc32_update(crc32_update(0, "IE", 2), "ND", 2);
            CHECK(whole == parts);
            CHECK(whole == 0xAE426082u);
        }

        SUBCASE("chunk crc covers type then payload") {
            auto payload = to_bytes("hi");
            std::string joined = "teSthi";
            CHECK(chunk_crc(chunk_type::from_text("teSt"), payload) ==
                  crc32_update(0, joined.data(), joined.size()));
        }
    }
}

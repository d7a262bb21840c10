#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

static chunk testing_chunk() {
    auto raw = make_raw_chunk(42, "RuSt", secret_message, secret_crc);
    return chunk::parse(raw);
}

static parse_error_code parse_code(const std::vector<std::byte>& raw, const parse_options& opts = {}) {
    try {
        (void)chunk::parse(raw, opts);
    } catch (const parse_error& e) {
        return e.code();
    }
    FAIL("Should have thrown exception");
    return parse_error_code::invalid_crc;
}

TEST_SUITE("CHUNK") {
    TEST_CASE("new chunk") {
        chunk c(chunk_type::from_text("RuSt"), to_bytes(secret_message));
        CHECK(c.length() == 42);
        CHECK(c.crc() == secret_crc);
        CHECK(c.type().to_string() == "RuSt");
        CHECK(c.data() == to_bytes(secret_message));
    }

    TEST_CASE("new chunk from text") {
        chunk c(chunk_type::from_text("RuSt"), secret_message);
        CHECK(c.length() == 42);
        CHECK(c.crc() == secret_crc);
        CHECK(c == chunk(chunk_type::from_text("RuSt"), to_bytes(secret_message)));
    }

    TEST_CASE("empty payload") {
        chunk c(chunk_id::IEND, std::vector<std::byte>{});
        CHECK(c.length() == 0);
        CHECK(c.crc() == 0xAE426082u);
        CHECK(c.data_as_string().empty());

        auto bytes = c.serialize();
        CHECK(bytes.size() == chunk::overhead);
        CHECK(chunk::parse(bytes) == c);
    }

    TEST_CASE("parsed chunk") {
        auto c = testing_chunk();
        CHECK(c.length() == 42);
        CHECK(c.type().to_string() == "RuSt");
        CHECK(c.data_as_string() == secret_message);
        CHECK(c.crc() == secret_crc);
    }

    TEST_CASE("data_as_string maps every byte value") {
        std::vector<std::byte> payload;
        for (int i = 0; i < 256; ++i) {
            payload.push_back(std::byte(i));
        }
        chunk c(chunk_type::from_text("biNs"), payload);
        auto s = c.data_as_string();
        REQUIRE(s.size() == 256);
        for (int i = 0; i < 256; ++i) {
            CHECK(static_cast<unsigned char>(s[i]) == i);
        }
    }

    TEST_CASE("serialize layout") {
        chunk c(chunk_type::from_text("RuSt"), secret_message);
        auto expected = make_raw_chunk(42, "RuSt", secret_message, secret_crc);
        CHECK(c.serialize() == expected);

        std::vector<std::byte> out = to_bytes("prefix");
        c.serialize_to(out);
        CHECK(out.size() == 6 + expected.size());
        CHECK(std::equal(expected.begin(), expected.end(), out.begin() + 6));
    }

    TEST_CASE("round trip") {
        std::vector<chunk> samples = {
            chunk(chunk_type::from_text("RuSt"), secret_message),
            chunk(chunk_type::from_text("teSt"), "hi"),
            chunk(chunk_id::IEND, std::vector<std::byte>{}),
            chunk(chunk_type('\0', '\x7F', '1', ' '), to_bytes(std::string(1000, '\xAB'))),
        };
        for (const auto& c : samples) {
            auto parsed = chunk::parse(c.serialize());
            CHECK(parsed == c);
            CHECK(parsed.crc() == c.crc());
            CHECK(parsed.length() == c.length());
        }
    }

    TEST_CASE("stream output") {
        std::ostringstream oss;
        oss << testing_chunk();
        CHECK(oss.str() ==
              "Chunk {\n"
              "  Length: 42\n"
              "  Type: RuSt\n"
              "  Data: 42 bytes\n"
              "  Crc: 2882656334\n"
              "}\n");
    }

    TEST_CASE("write to stream") {
        chunk c(chunk_type::from_text("teSt"), "hi");
        std::ostringstream oss;
        c.write(oss);
        auto bytes = c.serialize();
        CHECK(oss.str() == std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    }
}

TEST_SUITE("CHUNK_PARSE_ERRORS") {
    TEST_CASE("invalid crc") {
        auto raw = make_raw_chunk(42, "RuSt", secret_message, secret_crc - 1);
        CHECK(parse_code(raw) == parse_error_code::invalid_crc);
        CHECK_THROWS_AS((void)chunk::parse(raw), png_error);
    }

    TEST_CASE("single bit flips in type or payload are detected") {
        auto good = make_raw_chunk(42, "RuSt", secret_message, secret_crc);
        // Type starts after the length field, CRC field is the last 4 bytes
        for (std::size_t pos = 4; pos < good.size() - 4; ++pos) {
            for (int bit = 0; bit < 8; ++bit) {
                auto bad = good;
                bad[pos] ^= std::byte(1 << bit);
                CHECK(parse_code(bad) == parse_error_code::invalid_crc);
            }
        }
    }

    TEST_CASE("truncated at every stage") {
        auto good = make_raw_chunk(42, "RuSt", secret_message, secret_crc);

        SUBCASE("length") {
            CHECK(parse_code({}) == parse_error_code::length_not_found);
            CHECK(parse_code(std::vector<std::byte>(good.begin(), good.begin() + 3)) ==
                  parse_error_code::length_not_found);
        }

        SUBCASE("type") {
            CHECK(parse_code(std::vector<std::byte>(good.begin(), good.begin() + 4)) ==
                  parse_error_code::chunk_type_not_found);
            CHECK(parse_code(std::vector<std::byte>(good.begin(), good.begin() + 7)) ==
                  parse_error_code::chunk_type_not_found);
        }

        SUBCASE("payload") {
            CHECK(parse_code(std::vector<std::byte>(good.begin(), good.begin() + 8)) ==
                  parse_error_code::message_not_found);
            CHECK(parse_code(std::vector<std::byte>(good.begin(), good.begin() + 8 + 41)) ==
                  parse_error_code::message_not_found);
        }

        SUBCASE("crc") {
            CHECK(parse_code(std::vector<std::byte>(good.begin(), good.begin() + 8 + 42)) ==
                  parse_error_code::crc_not_found);
            CHECK(parse_code(std::vector<std::byte>(good.begin(), good.end() - 1)) ==
                  parse_error_code::crc_not_found);
        }
    }

    TEST_CASE("declared length larger than the buffer") {
        auto raw = make_raw_chunk(0xFFFFFFFFu, "RuSt", "short", 0);
        CHECK(parse_code(raw) == parse_error_code::message_not_found);
    }

    TEST_CASE("trailing bytes after a single record") {
        auto raw = make_raw_chunk(42, "RuSt", secret_message, secret_crc);
        raw.push_back(std::byte(0));
        CHECK(parse_code(raw) == parse_error_code::trailing_data);
    }

    TEST_CASE("size limit") {
        auto raw = make_raw_chunk(42, "RuSt", secret_message, secret_crc);

        parse_options opts;
        opts.max_chunk_size = 16;
        CHECK(parse_code(raw, opts) == parse_error_code::chunk_too_large);

        opts.max_chunk_size = 42;
        CHECK(chunk::parse(raw, opts).length() == 42);
    }

    TEST_CASE("binary type bytes are accepted") {
        chunk c(chunk_type('R', 'u', '1', 't'), "payload");
        auto parsed = chunk::parse(c.serialize());
        CHECK(parsed.type() == chunk_type('R', 'u', '1', 't'));
        CHECK_FALSE(parsed.type().is_valid());
    }
}

//
// Created by igor on 02/09/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <stdexcept>
#include <iosfwd>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {
    /**
     * @class chunk_type
     * @brief Four byte PNG chunk type code
     *
     * The ASCII case of each byte carries one property bit: critical,
     * public, reserved and safe-to-copy. Two construction paths exist on
     * purpose: from_bytes() accepts any four bytes read from a file, while
     * from_text() insists on four ASCII letters.
     */
    class PNGCHUNK_EXPORT chunk_type {
    public:
        // Constructor from 4 individual chars, no validation
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        // Constructor from raw bytes, no validation
        static chunk_type from_bytes(const void* data) {
            chunk_type result{'\0', '\0', '\0', '\0'};
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        static chunk_type from_bytes(const std::array<std::uint8_t, 4>& data) {
            return from_bytes(data.data());
        }

        /**
         * @brief Build a chunk type from user supplied text
         * @param text Exactly four ASCII letters
         * @return The chunk type
         * @throws chunk_type_error invalid_byte on the first non-letter,
         *         invalid_length if there are not exactly four letters
         */
        static chunk_type from_text(std::string_view text);

        // Byte 0 uppercase
        [[nodiscard]] bool is_critical() const { return is_upper(b[0]); }

        // Byte 1 uppercase
        [[nodiscard]] bool is_public() const { return is_upper(b[1]); }

        // Byte 2 uppercase
        [[nodiscard]] bool is_reserved_bit_valid() const { return is_upper(b[2]); }

        // Byte 3 lowercase
        [[nodiscard]] bool is_safe_to_copy() const { return is_lower(b[3]); }

        // Only the reserved bit decides validity
        [[nodiscard]] bool is_valid() const { return is_reserved_bit_valid(); }

        // True if all four bytes are ASCII letters
        [[nodiscard]] bool is_alphabetic() const {
            for (char c : b) {
                if (!is_upper(c) && !is_lower(c)) {
                    return false;
                }
            }
            return true;
        }

        [[nodiscard]] std::array<std::uint8_t, 4> bytes() const {
            std::array<std::uint8_t, 4> result{};
            std::memcpy(result.data(), b.data(), 4);
            return result;
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {b.data(), 4};
        }

        // Big-endian value, as the code appears on the wire
        [[nodiscard]] std::uint32_t to_uint32() const {
            return (std::uint32_t(static_cast<unsigned char>(b[0])) << 24) |
                   (std::uint32_t(static_cast<unsigned char>(b[1])) << 16) |
                   (std::uint32_t(static_cast<unsigned char>(b[2])) << 8) |
                    std::uint32_t(static_cast<unsigned char>(b[3]));
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return b < o.b; }

    private:
        static constexpr bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
        static constexpr bool is_lower(char c) { return c >= 'a' && c <= 'z'; }

        std::array<char, 4> b;
    };

    // Prints the four characters, escaping non-printable bytes as \xNN
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time chunk types, no letter check
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("Chunk type literal must be exactly 4 characters");
        }
        return { str[0], str[1], str[2], str[3] };
    }

    // Common chunk types
    namespace chunk_id {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
        inline constexpr chunk_type tEXt('t', 'E', 'X', 't');
    }
}

namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}

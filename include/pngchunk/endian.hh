//
// Created by igor on 02/09/2025.
//

#pragma once

#include <cstdint>

#include <pngchunk/pngchunk_config.h>

namespace pngchunk {
    // Platform endianness detection using CMake-generated config
#if PNGCHUNK_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // PNG stores every multi-byte integer big-endian
    inline std::uint32_t to_big_endian32(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    inline std::uint32_t from_big_endian32(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }
}

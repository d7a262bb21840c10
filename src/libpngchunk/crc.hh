//
// Created by igor on 03/09/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngchunk/chunk_type.hh>

namespace pngchunk {
    // CRC-32/ISO-HDLC: reflected, init and final xor 0xFFFFFFFF

    std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size);

    // CRC of type ++ payload, as stored after every chunk
    std::uint32_t chunk_crc(const chunk_type& type, const std::vector<std::byte>& data);
}

//
// Created by igor on 03/09/2025.
//

#include <zlib.h>
#include <algorithm>
#include <limits>

#include "crc.hh"

namespace pngchunk {
    std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size) {
        auto* p = static_cast<const Bytef*>(data);
        uLong value = crc;
        // zlib takes uInt lengths
        while (size > 0) {
            auto n = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            value = ::crc32(value, p, n);
            p += n;
            size -= n;
        }
        return static_cast<std::uint32_t>(value);
    }

    std::uint32_t chunk_crc(const chunk_type& type, const std::vector<std::byte>& data) {
        std::uint32_t crc = static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0));
        auto bytes = type.bytes();
        crc = crc32_update(crc, bytes.data(), bytes.size());
        return crc32_update(crc, data.data(), data.size());
    }
}

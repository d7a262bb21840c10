//
// Created by igor on 03/09/2025.
//

#include <pngchunk/endian.hh>
#include "output.hh"

namespace pngchunk {
    void byte_writer::write(const void* src, std::size_t size) {
        if (size == 0) {
            return;
        }
        auto* first = static_cast<const std::byte*>(src);
        m_out.insert(m_out.end(), first, first + size);
    }

    void byte_writer::write_u32be(std::uint32_t value) {
        std::uint32_t be = to_big_endian32(value);
        write(&be, sizeof(be));
    }

    void byte_writer::write_chunk_type(const chunk_type& type) {
        std::byte data[4];
        type.to_bytes(data);
        write(data, 4);
    }
}

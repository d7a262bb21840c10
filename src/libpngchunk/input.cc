//
// Created by igor on 03/09/2025.
//

#include <cstring>
#include <algorithm>

#include <pngchunk/endian.hh>
#include "input.hh"

namespace pngchunk {
    byte_reader::byte_reader(const std::byte* data, std::size_t size)
        : m_data(data), m_size(size), m_position(0) {
        THROW_IO_IF(!data && size != 0, "Null buffer of ", size, " bytes given to byte_reader");
    }

    std::size_t byte_reader::read(void* dst, std::size_t size) {
        THROW_IO_IF(!dst && size != 0, "Null buffer in read");

        std::size_t to_read = std::min(size, remaining());
        if (to_read == 0) {
            return 0;
        }

        std::memcpy(dst, m_data + m_position, to_read);
        m_position += to_read;
        return to_read;
    }

    std::vector<std::byte> byte_reader::read_exact(std::size_t size) {
        std::vector<std::byte> buffer(size);
        std::size_t actual = read(buffer.data(), size);
        THROW_IO_IF(actual != size, "Unexpected end of buffer: requested ", size, " got ", actual);
        return buffer;
    }

    std::uint32_t byte_reader::read_u32be() {
        std::uint32_t value;
        std::size_t actual = read(&value, sizeof(value));
        THROW_IO_IF(actual != sizeof(value), "Failed to read ", sizeof(value), " bytes at offset ", m_position);
        return from_big_endian32(value);
    }

    chunk_type byte_reader::read_chunk_type() {
        std::byte data[4];
        std::size_t actual = read(data, 4);
        THROW_IO_IF(actual != 4, "Failed to read chunk type at offset ", m_position);
        return chunk_type::from_bytes(data);
    }

    void byte_reader::skip(std::size_t size) {
        THROW_IO_IF(size > remaining(), "Skip beyond end of buffer: ", size, " > ", remaining());
        m_position += size;
    }

    void byte_reader::seek(std::uint64_t offset) {
        THROW_IO_IF(offset > m_size, "Cannot seek to offset ", offset, " - buffer size is only ", m_size, " bytes");
        m_position = static_cast<std::size_t>(offset);
    }
}

//
// Created by igor on 03/09/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngchunk/exceptions.hh>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    // Bounded read cursor over a memory buffer. The buffer is not owned.
    class byte_reader {
        public:
            byte_reader(const std::byte* data, std::size_t size);

            byte_reader(const byte_reader&) = delete;
            byte_reader& operator = (const byte_reader&) = delete;

            // Copies up to size bytes, returns how many were copied
            std::size_t read(void* dst, std::size_t size);

            // Throws io_error on a short read
            std::vector<std::byte> read_exact(std::size_t size);
            std::uint32_t read_u32be();
            chunk_type read_chunk_type();

            void skip(std::size_t size);
            void seek(std::uint64_t offset);

            [[nodiscard]] std::uint64_t tell() const { return m_position; }
            [[nodiscard]] std::uint64_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] bool at_end() const { return m_position == m_size; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}

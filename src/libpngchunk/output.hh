//
// Created by igor on 03/09/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    // Appends to a caller owned byte vector
    class byte_writer {
        public:
            explicit byte_writer(std::vector<std::byte>& out) : m_out(out) {}

            void write(const void* src, std::size_t size);
            void write_u32be(std::uint32_t value);
            void write_chunk_type(const chunk_type& type);

            void reserve(std::size_t extra) { m_out.reserve(m_out.size() + extra); }
            [[nodiscard]] std::size_t tell() const { return m_out.size(); }

        private:
            std::vector<std::byte>& m_out;
    };
}

//
// Created by igor on 04/09/2025.
//

#include <cstring>

#include <pngchunk/chunk_iterator.hh>
#include <pngchunk/png.hh>
#include <pngchunk/exceptions.hh>
#include "input.hh"

namespace pngchunk {

    chunk_iterator::chunk_iterator(const std::byte* data, std::size_t size, const parse_options& options)
        : m_reader(std::make_unique<byte_reader>(data, size))
        , m_options(options)
        , m_current{}
        , m_ended(false) {
        const auto& sig = png::signature;

        THROW_PARSE_IF(size < sig.size(), parse_error_code::signature_mismatch, 0,
                       "Buffer of ", size, " bytes is too short for the PNG signature");
        THROW_PARSE_IF(std::memcmp(data, sig.data(), sig.size()) != 0, parse_error_code::signature_mismatch, 0,
                       "Buffer does not start with the PNG signature");

        m_reader->skip(sig.size());

        // Read the first chunk; a signature-only buffer has none
        m_current.index = 0;
        if (m_reader->at_end()) {
            m_ended = true;
            return;
        }
        m_current.file_offset = m_reader->tell();
        m_current.value.emplace(chunk::parse(*m_reader, m_options));
    }

    chunk_iterator::~chunk_iterator() = default;

    void chunk_iterator::advance() {
        if (m_ended) {
            return;
        }

        m_current.value.reset();
        if (m_reader->at_end()) {
            m_ended = true;
            return;
        }

        m_current.index++;
        m_current.file_offset = m_reader->tell();
        m_current.value.emplace(chunk::parse(*m_reader, m_options));
    }

} // namespace pngchunk

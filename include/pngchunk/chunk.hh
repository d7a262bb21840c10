/**
 * @file chunk.hh
 * @brief A single length-prefixed, CRC protected PNG chunk
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <iosfwd>
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    class byte_reader;

    /**
     * @class chunk
     * @brief One PNG chunk record
     *
     * Wire layout, all integers big-endian:
     * @code
     * [4] length  [4] type  [length] payload  [4] CRC-32 over type ++ payload
     * @endcode
     *
     * Only the type and payload are stored. Length and CRC are derived from
     * them on every call, so they can never disagree with the contents.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /**
         * @brief Size of the fixed part of a record (length, type and CRC)
         */
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Create a chunk from a type and a payload
         * @param type Chunk type
         * @param data Payload, may be empty
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Create a chunk whose payload is the bytes of a string
         * @param type Chunk type
         * @param text Payload text, one byte per character
         */
        chunk(chunk_type type, std::string_view text);

        /**
         * @brief Parse exactly one chunk record
         * @param data Start of the record
         * @param size Size of the record in bytes
         * @param options Size limit and warning handler
         * @return The parsed chunk
         * @throws parse_error if the record is truncated, has a bad CRC,
         *         or is followed by extra bytes
         */
        static chunk parse(const std::byte* data, std::size_t size, const parse_options& options = {});

        static chunk parse(const std::vector<std::byte>& data, const parse_options& options = {});

        /**
         * @brief Parse the next chunk record from a reader
         * @param in Reader positioned at the start of a record
         * @param options Size limit and warning handler
         * @return The parsed chunk, the reader is left after its CRC
         * @throws parse_error on a truncated record or a bad CRC
         */
        static chunk parse(byte_reader& in, const parse_options& options);

        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }

        // Payload size, always taken from the live payload
        [[nodiscard]] std::uint32_t length() const { return static_cast<std::uint32_t>(m_data.size()); }

        // CRC-32/ISO-HDLC over type ++ payload, recomputed on every call
        [[nodiscard]] std::uint32_t crc() const;

        /**
         * @brief Payload as text, one character per byte
         * @return Decoded string
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Encode the chunk in wire format
         * @return length ++ type ++ payload ++ crc
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /**
         * @brief Append the wire format to an existing buffer
         * @param out Buffer to append to
         */
        void serialize_to(std::vector<std::byte>& out) const;

        /**
         * @brief Write the wire format to a stream
         * @throws io_error if the stream fails
         */
        void write(std::ostream& os) const;

        bool operator==(const chunk& o) const { return m_type == o.m_type && m_data == o.m_data; }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk_type m_type;
        std::vector<std::byte> m_data;
    };

    // Multi-line diagnostic dump: length, type, payload size and CRC
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk

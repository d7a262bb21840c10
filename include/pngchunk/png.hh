/**
 * @file png.hh
 * @brief PNG container: signature plus an ordered chunk sequence
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <iosfwd>
#include <array>
#include <vector>
#include <optional>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class png
     * @brief The chunk layer of a PNG file
     *
     * Holds the fixed 8-byte signature and the chunks in file order. Order
     * is preserved exactly, so parse() followed by serialize() reproduces
     * the input byte for byte. Chunk payloads are opaque; no chunk type is
     * treated specially.
     */
    class PNGCHUNK_EXPORT png {
    public:
        using container_type = std::vector<chunk>;
        using const_iterator = container_type::const_iterator;

        /**
         * @brief The PNG file signature
         */
        static constexpr std::array<std::uint8_t, 8> signature = {
            0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
        };

        /**
         * @brief Empty container: signature only
         */
        png() = default;

        /**
         * @brief Container holding the given chunks in order
         */
        explicit png(container_type chunks);

        /**
         * @brief Parse a complete PNG buffer
         * @param data Buffer starting with the signature
         * @param size Buffer size in bytes
         * @param options Parse options
         * @return The container
         * @throws parse_error on a signature mismatch or the first bad chunk;
         *         no container is produced in that case
         */
        static png parse(const std::byte* data, std::size_t size, const parse_options& options = {});

        static png parse(const std::vector<std::byte>& data, const parse_options& options = {});

        /**
         * @brief Read a stream to its end and parse it
         * @throws io_error if the stream cannot be read
         * @throws parse_error as for the buffer overload
         */
        static png parse(std::istream& is, const parse_options& options = {});

        /**
         * @brief Append a chunk at the end; duplicates are allowed
         */
        void append_chunk(chunk c);

        /**
         * @brief First chunk of the given type
         * @return Pointer into the container, or nullptr if none matches.
         *         Invalidated by any later mutation.
         */
        [[nodiscard]] const chunk* chunk_by_type(const chunk_type& type) const;

        /**
         * @brief First chunk of the type named by text
         * @throws chunk_type_error if the text is not a valid chunk type
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        /**
         * @brief Remove every chunk of the given type
         * @return Number of chunks removed; 0 is not an error
         */
        std::size_t remove_chunks(const chunk_type& type);

        /**
         * @brief Remove the first chunk of the given type
         * @return The removed chunk, or nullopt if none matches
         */
        std::optional<chunk> remove_first_chunk(const chunk_type& type);

        [[nodiscard]] const container_type& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }
        [[nodiscard]] bool empty() const { return m_chunks.empty(); }

        [[nodiscard]] const_iterator begin() const { return m_chunks.begin(); }
        [[nodiscard]] const_iterator end() const { return m_chunks.end(); }

        /**
         * @brief Encode the whole file
         * @return signature ++ every chunk in order
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /**
         * @brief Write the encoded file to a stream
         * @throws io_error if the stream fails
         */
        void write(std::ostream& os) const;

        bool operator==(const png& o) const { return m_chunks == o.m_chunks; }
        bool operator!=(const png& o) const { return !(*this == o); }

    private:
        container_type m_chunks;
    };

    // One line per chunk: index, length, type, payload size, CRC
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

} // namespace pngchunk

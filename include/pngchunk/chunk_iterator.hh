/**
 * @file chunk_iterator.hh
 * @brief Sequential walk over the chunks of a PNG byte buffer
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <memory>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    class byte_reader;

    /**
     * @class chunk_iterator
     * @brief Forward iterator over the chunks following a PNG signature
     *
     * The signature is checked on construction and each record is parsed
     * and CRC-checked as the iterator reaches it. Any malformed record
     * throws; the iterator never yields a partial chunk.
     *
     * The buffer must outlive the iterator.
     */
    class PNGCHUNK_EXPORT chunk_iterator {
    public:
        /**
         * @struct chunk_info
         * @brief The chunk under the iterator
         */
        struct chunk_info {
            std::optional<chunk> value;   ///< Parsed chunk (empty once the iterator has ended)
            std::uint64_t file_offset = 0;///< Absolute offset of the length field
            std::size_t index = 0;        ///< Position in the sequence, 0 based
        };

        /**
         * @brief Start iterating a PNG buffer
         * @param data Buffer starting with the PNG signature
         * @param size Buffer size in bytes
         * @param options Parse options forwarded to every chunk
         * @throws parse_error signature_mismatch, or any error of the first chunk
         */
        chunk_iterator(const std::byte* data, std::size_t size, const parse_options& options = {});
        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        chunk_iterator& operator=(const chunk_iterator&) = delete;

        const chunk_info& current() const { return m_current; }
        chunk_info& current() { return m_current; }

        /**
         * @brief Advance to the next chunk
         * @throws parse_error if the next record is malformed
         */
        void next() {
            advance();
        }

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

    private:
        void advance();

        std::unique_ptr<byte_reader> m_reader;
        parse_options m_options;
        chunk_info m_current;
        bool m_ended;
    };

    /**
     * @brief Call a function for every chunk of a PNG buffer
     *
     * @tparam Func Callable accepting const chunk_iterator::chunk_info&
     * @param data Buffer starting with the PNG signature
     * @param size Buffer size in bytes
     * @param func Function to call for each chunk
     * @param options Parse options
     */
    template<typename Func>
    void for_each_chunk(const std::byte* data, std::size_t size, Func func, const parse_options& options) {
        chunk_iterator it(data, size, options);

        while (it.has_next()) {
            func(static_cast<const chunk_iterator::chunk_info&>(it.current()));
            it.next();
        }
    }

    template<typename Func>
    void for_each_chunk(const std::byte* data, std::size_t size, Func func) {
        for_each_chunk(data, size, func, parse_options{});
    }

} // namespace pngchunk

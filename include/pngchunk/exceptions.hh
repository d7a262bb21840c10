/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 * @author Igor
 * @date 02/09/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <cstdint>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class png_error
     * @brief Base exception class for all PNG chunk errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every library error with a single catch block.
     */
    class png_error : public std::runtime_error {
    public:
        explicit png_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when reading from or writing to a stream fails.
     */
    class io_error : public png_error {
    public:
        explicit io_error(const std::string& msg)
            : png_error(msg) {}
    };

    /**
     * @enum parse_error_code
     * @brief Stage at which binary parsing failed
     */
    enum class parse_error_code {
        length_not_found,     ///< Fewer than 4 bytes left for the length field
        chunk_type_not_found, ///< Fewer than 4 bytes left for the type field
        message_not_found,    ///< Fewer payload bytes than the declared length
        crc_not_found,        ///< Fewer than 4 bytes left for the CRC field
        invalid_crc,          ///< Stored CRC differs from the computed one
        signature_mismatch,   ///< Buffer does not start with the PNG signature
        trailing_data,        ///< Bytes left over after a single chunk record
        chunk_too_large       ///< Declared length exceeds parse_options::max_chunk_size
    };

    /**
     * @brief Stable name of a parse error code
     * @param code Error code
     * @return Name such as "invalid_crc"
     */
    PNGCHUNK_EXPORT const char* to_string(parse_error_code code);

    /**
     * @class parse_error
     * @brief Exception for malformed binary input
     *
     * Thrown when the byte stream is truncated, corrupted, or does not
     * start with the PNG signature. Carries the failing stage and the
     * absolute offset of the record being parsed.
     */
    class parse_error : public png_error {
    public:
        parse_error(parse_error_code code, std::uint64_t offset, const std::string& msg)
            : png_error(msg), m_code(code), m_offset(offset) {}

        [[nodiscard]] parse_error_code code() const noexcept { return m_code; }
        [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }

    private:
        parse_error_code m_code;
        std::uint64_t m_offset;
    };

    /**
     * @enum chunk_type_error_code
     * @brief Reason a textual chunk type was rejected
     */
    enum class chunk_type_error_code {
        invalid_byte,  ///< A character is not ASCII alphabetic
        invalid_length ///< Not exactly 4 characters
    };

    /**
     * @class chunk_type_error
     * @brief Exception for a malformed textual chunk type
     *
     * Only raised by chunk_type::from_text; binary parsing never
     * produces it.
     */
    class chunk_type_error : public png_error {
    public:
        chunk_type_error(chunk_type_error_code code, char offending, const std::string& msg)
            : png_error(msg), m_code(code), m_offending(offending) {}

        [[nodiscard]] chunk_type_error_code code() const noexcept { return m_code; }

        /**
         * @brief The rejected character
         * @return The first non-alphabetic character for invalid_byte, '\0' otherwise
         */
        [[nodiscard]] char offending_char() const noexcept { return m_offending; }

    private:
        chunk_type_error_code m_code;
        char m_offending;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error with a code, the record offset and a formatted message
     */
    #define THROW_PARSE(code, offset, ...) \
        throw ::pngchunk::parse_error((code), (offset), ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     */
    #define THROW_PARSE_IF(condition, code, offset, ...) \
        do { if (condition) THROW_PARSE(code, offset, __VA_ARGS__); } while(0)

    /**
     * @def THROW_CHUNK_TYPE
     * @brief Throw a chunk_type_error with a code, the offending character and a formatted message
     */
    #define THROW_CHUNK_TYPE(code, offending, ...) \
        throw ::pngchunk::chunk_type_error((code), (offending), ::pngchunk::build_error_msg(__VA_ARGS__))

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk

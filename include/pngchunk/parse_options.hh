/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk streams
 * @author Igor
 * @date 02/09/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing chunks
     *
     * Controls the size limit applied to declared chunk lengths and
     * where non-fatal observations are reported.
     */
    struct parse_options {
        /**
         * @brief Maximum allowed chunk payload size in bytes
         *
         * Chunks declaring a larger length fail with chunk_too_large
         * before any payload is read. The default admits every 32-bit
         * length.
         */
        std::uint64_t max_chunk_size = std::uint64_t(1) << 32;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset of the chunk record the warning is about
         * @param category Warning category ("reserved_bit", "non_alpha_type")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk

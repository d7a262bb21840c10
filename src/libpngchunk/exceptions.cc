//
// Created by igor on 02/09/2025.
//

#include <pngchunk/exceptions.hh>

namespace pngchunk {

    const char* to_string(parse_error_code code) {
        switch (code) {
            case parse_error_code::length_not_found:
                return "length_not_found";
            case parse_error_code::chunk_type_not_found:
                return "chunk_type_not_found";
            case parse_error_code::message_not_found:
                return "message_not_found";
            case parse_error_code::crc_not_found:
                return "crc_not_found";
            case parse_error_code::invalid_crc:
                return "invalid_crc";
            case parse_error_code::signature_mismatch:
                return "signature_mismatch";
            case parse_error_code::trailing_data:
                return "trailing_data";
            case parse_error_code::chunk_too_large:
                return "chunk_too_large";
        }
        // make compiler happy
        return "unknown";
    }

} // namespace pngchunk

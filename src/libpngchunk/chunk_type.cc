//
// Created by igor on 02/09/2025.
//

#include <ostream>
#include <iomanip>

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    chunk_type chunk_type::from_text(std::string_view text) {
        for (std::size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (!is_upper(c) && !is_lower(c)) {
                THROW_CHUNK_TYPE(chunk_type_error_code::invalid_byte, c,
                                 "Invalid chunk type character '", c, "' at position ", i,
                                 " in \"", text, "\"");
            }
        }

        if (text.size() != 4) {
            THROW_CHUNK_TYPE(chunk_type_error_code::invalid_length, '\0',
                             "Invalid chunk type length (expected 4), got ", text.size(),
                             " in \"", text, "\"");
        }

        return {text[0], text[1], text[2], text[3]};
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        auto flags = os.flags();
        auto fill = os.fill();
        for (char c : t) {
            if (c >= 32 && c <= 126) {
                os << c;
            } else {
                // Escape non-printable characters
                os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                   << static_cast<unsigned>(static_cast<unsigned char>(c));
            }
        }
        os.flags(flags);
        os.fill(fill);
        return os;
    }
}

//
// Created by igor on 03/09/2025.
//

#include <ostream>

#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>
#include "input.hh"
#include "output.hh"
#include "crc.hh"

namespace pngchunk {

    static void report_type_warnings(const chunk_type& type, std::uint64_t offset, const parse_options& options) {
        if (!options.on_warning) {
            return;
        }
        if (!type.is_alphabetic()) {
            options.on_warning(offset, "non_alpha_type",
                               build_error_msg("Chunk type ", type, " contains bytes outside A-Z/a-z"));
        }
        if (!type.is_reserved_bit_valid()) {
            options.on_warning(offset, "reserved_bit",
                               build_error_msg("Chunk type ", type, " has the reserved bit set"));
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_type(type)
        , m_data(std::move(data)) {
    }

    chunk::chunk(chunk_type type, std::string_view text)
        : m_type(type)
        , m_data(reinterpret_cast<const std::byte*>(text.data()),
                 reinterpret_cast<const std::byte*>(text.data()) + text.size()) {
    }

    chunk chunk::parse(byte_reader& in, const parse_options& options) {
        const std::uint64_t start = in.tell();

        THROW_PARSE_IF(in.remaining() < 4, parse_error_code::length_not_found, start,
                       "Chunk length not found at offset ", start, ": only ", in.remaining(), " bytes left");
        const std::uint32_t length = in.read_u32be();

        THROW_PARSE_IF(in.remaining() < 4, parse_error_code::chunk_type_not_found, start,
                       "Chunk type not found at offset ", start + 4, ": only ", in.remaining(), " bytes left");
        const chunk_type type = in.read_chunk_type();

        THROW_PARSE_IF(length > options.max_chunk_size, parse_error_code::chunk_too_large, start,
                       "Chunk ", type, " at offset ", start, " declares ", length,
                       " bytes, exceeding maximum allowed size of ", options.max_chunk_size);

        THROW_PARSE_IF(in.remaining() < length, parse_error_code::message_not_found, start,
                       "Chunk ", type, " at offset ", start, " declares ", length,
                       " bytes of data but only ", in.remaining(), " remain");
        std::vector<std::byte> data = in.read_exact(length);

        THROW_PARSE_IF(in.remaining() < 4, parse_error_code::crc_not_found, start,
                       "CRC of chunk ", type, " at offset ", start, " not found: only ",
                       in.remaining(), " bytes left");
        const std::uint32_t stored_crc = in.read_u32be();

        const std::uint32_t computed_crc = chunk_crc(type, data);
        THROW_PARSE_IF(stored_crc != computed_crc, parse_error_code::invalid_crc, start,
                       "Invalid CRC for chunk ", type, " at offset ", start, ": stored ", stored_crc,
                       ", computed ", computed_crc);

        report_type_warnings(type, start, options);
        return chunk(type, std::move(data));
    }

    chunk chunk::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        byte_reader in(data, size);
        chunk result = parse(in, options);
        THROW_PARSE_IF(!in.at_end(), parse_error_code::trailing_data, 0,
                       "Chunk ", result.type(), " ends at offset ", in.tell(), " but the buffer has ",
                       in.remaining(), " more bytes");
        return result;
    }

    chunk chunk::parse(const std::vector<std::byte>& data, const parse_options& options) {
        return parse(data.data(), data.size(), options);
    }

    std::uint32_t chunk::crc() const {
        return chunk_crc(m_type, m_data);
    }

    std::string chunk::data_as_string() const {
        std::string result;
        result.reserve(m_data.size());
        for (std::byte b : m_data) {
            result.push_back(static_cast<char>(b));
        }
        return result;
    }

    void chunk::serialize_to(std::vector<std::byte>& out) const {
        byte_writer w(out);
        w.reserve(overhead + m_data.size());
        w.write_u32be(length());
        w.write_chunk_type(m_type);
        w.write(m_data.data(), m_data.size());
        w.write_u32be(crc());
    }

    std::vector<std::byte> chunk::serialize() const {
        std::vector<std::byte> out;
        serialize_to(out);
        return out;
    }

    void chunk::write(std::ostream& os) const {
        auto bytes = serialize();
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_IF(!os, "Failed to write chunk ", m_type, " (", bytes.size(), " bytes)");
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Chunk {\n";
        os << "  Length: " << c.length() << "\n";
        os << "  Type: " << c.type() << "\n";
        os << "  Data: " << c.data().size() << " bytes\n";
        os << "  Crc: " << c.crc() << "\n";
        os << "}\n";
        return os;
    }

} // namespace pngchunk

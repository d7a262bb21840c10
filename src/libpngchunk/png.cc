//
// Created by igor on 04/09/2025.
//

#include <istream>
#include <ostream>
#include <algorithm>

#include <pngchunk/png.hh>
#include <pngchunk/chunk_iterator.hh>
#include <pngchunk/exceptions.hh>
#include "output.hh"

namespace pngchunk {

    png::png(container_type chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        container_type chunks;

        chunk_iterator it(data, size, options);
        while (it.has_next()) {
            chunks.push_back(std::move(*it.current().value));
            it.next();
        }

        return png(std::move(chunks));
    }

    png png::parse(const std::vector<std::byte>& data, const parse_options& options) {
        return parse(data.data(), data.size(), options);
    }

    png png::parse(std::istream& is, const parse_options& options) {
        THROW_IO_IF(!is.good(), "Stream in bad state");

        std::vector<std::byte> buffer;
        char block[4096];
        while (is.read(block, sizeof(block)) || is.gcount() > 0) {
            auto* first = reinterpret_cast<const std::byte*>(block);
            buffer.insert(buffer.end(), first, first + is.gcount());
        }
        THROW_IO_IF(is.bad(), "Stream read failed after ", buffer.size(), " bytes");

        return parse(buffer, options);
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    const chunk* png::chunk_by_type(const chunk_type& type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&type](const chunk& c) {
            return c.type() == type;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        return chunk_by_type(chunk_type::from_text(type));
    }

    std::size_t png::remove_chunks(const chunk_type& type) {
        auto first = std::remove_if(m_chunks.begin(), m_chunks.end(), [&type](const chunk& c) {
            return c.type() == type;
        });
        auto removed = static_cast<std::size_t>(std::distance(first, m_chunks.end()));
        m_chunks.erase(first, m_chunks.end());
        return removed;
    }

    std::optional<chunk> png::remove_first_chunk(const chunk_type& type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&type](const chunk& c) {
            return c.type() == type;
        });
        if (it == m_chunks.end()) {
            return std::nullopt;
        }
        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    std::vector<std::byte> png::serialize() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += chunk::overhead + c.data().size();
        }

        std::vector<std::byte> out;
        out.reserve(total);

        byte_writer w(out);
        w.write(signature.data(), signature.size());
        for (const auto& c : m_chunks) {
            c.serialize_to(out);
        }
        return out;
    }

    void png::write(std::ostream& os) const {
        auto bytes = serialize();
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_IF(!os, "Failed to write PNG (", bytes.size(), " bytes)");
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        os << "PNG: " << p.size() << " chunk(s)\n";
        std::size_t index = 0;
        for (const auto& c : p) {
            os << "  #" << index++
               << "  Length: " << c.length()
               << "  Type: " << c.type()
               << "  Data: " << c.data().size() << " bytes"
               << "  Crc: " << c.crc() << "\n";
        }
        return os;
    }

} // namespace pngchunk

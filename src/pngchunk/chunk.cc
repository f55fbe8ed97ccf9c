#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>

#include <ostream>
#include <utility>
#include <algorithm>
#include <zlib.h>

#include "input.hh"
#include "output.hh"
#include "utf8.hh"

namespace pngchunk {

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(static_cast<std::uint32_t>(data.size())),
          m_type(type),
          m_data(std::move(data)),
          m_crc(calculate_crc(m_type, m_data.data(), m_data.size())) {
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length), m_type(type), m_data(std::move(data)), m_crc(crc) {
    }

    chunk chunk::from_strings(std::string_view type_text, std::string_view message) {
        auto type = chunk_type::parse(type_text);
        auto first = reinterpret_cast<const std::byte*>(message.data());
        return {type, std::vector<std::byte>(first, first + message.size())};
    }

    chunk chunk::parse(const void* data, std::size_t size) {
        PNGCHUNK_THROW_PARSE_IF(size < 8, error_code::too_short,
            "Invalid chunk: need at least 8 bytes for length and type, got ", size);

        input in(data, size);

        auto length = in.read<std::uint32_t>(byte_order::big);
        auto type = in.read_chunk_type();

        PNGCHUNK_THROW_PARSE_IF(length > in.remaining(), error_code::truncated,
            "Chunk ", type, " declares ", length, " data bytes but only ",
            in.remaining(), " remain");
        auto payload = in.read_exact(length);

        PNGCHUNK_THROW_PARSE_IF(in.remaining() < 4, error_code::truncated,
            "Chunk ", type, " is missing its CRC: ", in.remaining(), " of 4 bytes present");
        auto stored = in.read<std::uint32_t>(byte_order::big);

        auto computed = calculate_crc(type, payload.data(), payload.size());
        if (stored != computed) {
            throw crc_error(stored, computed, build_error_msg(
                "CRC check failed for chunk ", type, ": stored 0x", std::hex, stored,
                ", computed 0x", computed));
        }

        return {length, type, std::move(payload), stored};
    }

    std::uint32_t chunk::calculate_crc(const chunk_type& type, const void* data, std::size_t size) {
        Bytef type_bytes[4];
        type.to_bytes(type_bytes);

        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, type_bytes, 4);

        // zlib takes uInt lengths, feed large payloads in pieces
        auto bytes = static_cast<const Bytef*>(data);
        while (size > 0) {
            auto piece = static_cast<uInt>(std::min<std::size_t>(size, 1u << 30));
            crc = crc32(crc, bytes, piece);
            bytes += piece;
            size -= piece;
        }
        return static_cast<std::uint32_t>(crc);
    }

    bool chunk::is_crc_valid() const {
        return m_crc == calculate_crc(m_type, m_data.data(), m_data.size());
    }

    std::vector<std::byte> chunk::as_wire_bytes() const {
        std::vector<std::byte> result;
        append_wire_bytes(result);
        return result;
    }

    void chunk::append_wire_bytes(std::vector<std::byte>& out) const {
        output o(out);
        o.reserve(wire_size());
        o.write(m_length, byte_order::big);
        o.write_chunk_type(m_type);
        o.write(m_data.data(), m_data.size());
        o.write(m_crc, byte_order::big);
    }

    std::string chunk::interpret_data_as_text() const {
        if (auto bad = find_invalid_utf8(m_data.data(), m_data.size())) {
            throw encoding_error(*bad, build_error_msg(
                "Data of chunk ", m_type, " is not valid UTF-8 at offset ", *bad));
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Chunk {\n"
           << "  Length: " << c.m_length << "\n"
           << "  Type: " << c.m_type << "\n"
           << "  Data: " << c.m_data.size() << " bytes\n"
           << "  Crc: " << c.m_crc << "\n"
           << "}\n";
        return os;
    }

} // namespace pngchunk

/**
 * @file chunk.hh
 * @brief A single length-prefixed, CRC-checked PNG chunk
 *
 * Wire layout of a chunk (all integers big-endian):
 *
 * | field  | size          |
 * |--------|---------------|
 * | length | 4             |
 * | type   | 4             |
 * | data   | length        |
 * | crc    | 4             |
 *
 * The CRC is CRC-32/IEEE (zlib's crc32) over type and data.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief One validated chunk: type code, owned payload and CRC
     *
     * A chunk is immutable once constructed. A chunk built from
     * application data always carries the CRC of its type and data;
     * a chunk read from bytes is rejected if its stored CRC does not match.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Size of length, type and crc fields together
        static constexpr std::size_t framing_size = 12;

        /**
         * @brief Create a chunk from a type and its payload
         *
         * Length and CRC are computed from the arguments.
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Create a chunk from a type code text and a message
         * @param type_text Four ASCII letters
         * @param message Payload, stored byte for byte
         * @throws format_error, invalid_byte_error if type_text is not a valid type
         */
        static chunk from_strings(std::string_view type_text, std::string_view message);

        /**
         * @brief Read the first chunk from a byte buffer
         *
         * Bytes after the chunk are ignored, wire_size() tells how many
         * bytes were used.
         *
         * @param data Start of the chunk (its length field)
         * @param size Bytes available
         * @throws parse_error too_short / truncated
         * @throws invalid_byte_error if the type code is not four letters
         * @throws crc_error if the stored CRC does not match
         */
        static chunk parse(const void* data, std::size_t size);

        static chunk parse(const std::vector<std::byte>& bytes) {
            return parse(bytes.data(), bytes.size());
        }

        /**
         * @brief CRC-32/IEEE of a type code followed by data
         */
        static std::uint32_t calculate_crc(const chunk_type& type, const void* data, std::size_t size);

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Number of bytes the chunk occupies on the wire
        [[nodiscard]] std::size_t wire_size() const { return framing_size + m_data.size(); }

        /// Recompute the CRC and compare it with the stored one
        [[nodiscard]] bool is_crc_valid() const;

        /**
         * @brief Serialize as length, type, data, crc
         */
        [[nodiscard]] std::vector<std::byte> as_wire_bytes() const;

        /**
         * @brief Append the serialized chunk to an existing buffer
         */
        void append_wire_bytes(std::vector<std::byte>& out) const;

        /**
         * @brief Payload as text
         * @throws encoding_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string interpret_data_as_text() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

        friend std::ostream& operator<<(std::ostream& os, const chunk& c);

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

} // namespace pngchunk

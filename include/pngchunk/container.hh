/**
 * @file container.hh
 * @brief A PNG byte stream: signature followed by an ordered list of chunks
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <string_view>
#include <vector>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class container
     * @brief Parsed PNG chunk stream
     *
     * Holds the 8-byte signature and every chunk in wire order. The
     * container owns its chunks; mutation is limited to insert and
     * remove so that the terminal chunk (normally IEND) stays last.
     *
     * A container is not thread-safe. Concurrent use of one instance
     * requires external synchronization.
     */
    class PNGCHUNK_EXPORT container {
    public:
        /// The fixed PNG signature: 89 50 4E 47 0D 0A 1A 0A
        static constexpr std::array<std::uint8_t, 8> signature{137, 80, 78, 71, 13, 10, 26, 10};

        /**
         * @brief Empty container with the PNG signature and no chunks
         */
        container();

        /**
         * @brief Parse a complete PNG byte stream
         *
         * The whole stream is validated: any header, framing, type or
         * CRC error aborts the parse, no partial container is returned.
         *
         * @param data Start of the stream
         * @param size Stream size in bytes
         * @param options Strictness, size limit and warning callback
         * @throws header_error if the signature is missing or wrong
         * @throws parse_error, crc_error, invalid_byte_error on chunk errors
         */
        static container parse(const void* data, std::size_t size, const parse_options& options);

        static container parse(const void* data, std::size_t size) {
            return parse(data, size, parse_options{});
        }

        static container parse(const std::vector<std::byte>& bytes, const parse_options& options) {
            return parse(bytes.data(), bytes.size(), options);
        }

        static container parse(const std::vector<std::byte>& bytes) {
            return parse(bytes.data(), bytes.size(), parse_options{});
        }

        /**
         * @brief Serialize as signature followed by every chunk in order
         */
        [[nodiscard]] std::vector<std::byte> to_wire_bytes() const;

        /**
         * @brief Insert a chunk before the current last chunk
         *
         * If the container is empty the chunk becomes its only element.
         * The last chunk is assumed to be the terminal one; this is not
         * verified.
         */
        void insert(chunk c);

        /**
         * @brief Append a chunk after every existing chunk
         */
        void append(chunk c);

        /**
         * @brief Remove and return the first chunk of the given type
         * @param type_text Four ASCII letters
         * @throws format_error, invalid_byte_error if type_text is not a valid type
         * @throws not_found_error if no chunk has that type
         */
        chunk remove_first_by_type(std::string_view type_text);

        /**
         * @brief First chunk of the given type
         * @return nullptr if type_text is not a valid type or nothing matches
         */
        [[nodiscard]] const chunk* find_first_by_type(std::string_view type_text) const;

        [[nodiscard]] const std::vector<chunk>& chunks() const noexcept { return m_chunks; }
        [[nodiscard]] const std::array<std::uint8_t, 8>& header() const noexcept { return m_header; }
        [[nodiscard]] std::size_t size() const noexcept { return m_chunks.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_chunks.empty(); }

        bool operator==(const container& o) const {
            return m_header == o.m_header && m_chunks == o.m_chunks;
        }
        bool operator!=(const container& o) const { return !(*this == o); }

        friend std::ostream& operator<<(std::ostream& os, const container& c);

    private:
        std::array<std::uint8_t, 8> m_header;
        std::vector<chunk> m_chunks;
    };

} // namespace pngchunk

/**
 * @file chunk_type.hh
 * @brief Validated four-letter PNG chunk type code
 *
 * A chunk type is four ASCII letters. The case of each letter (bit 5)
 * encodes one property bit:
 *
 * | byte | upper case | lower case   |
 * |------|------------|--------------|
 * | 0    | critical   | ancillary    |
 * | 1    | public     | private      |
 * | 2    | reserved (must be upper)  |
 * | 3    | unsafe to copy | safe to copy |
 */
#pragma once

#include <array>
#include <cstring>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>

#include <pngchunk/exceptions.hh>

namespace pngchunk {
    class chunk_type {
        public:
            // Constructor from 4 individual chars, throws invalid_byte_error
            constexpr chunk_type(char c0, char c1, char c2, char c3)
                : m_bytes{ checked(c0), checked(c1), checked(c2), checked(c3) } {}

            // Constructor from raw bytes, throws invalid_byte_error
            explicit constexpr chunk_type(const std::array<std::uint8_t, 4>& bytes)
                : chunk_type(static_cast<char>(bytes[0]), static_cast<char>(bytes[1]),
                             static_cast<char>(bytes[2]), static_cast<char>(bytes[3])) {}

            // Constructor from 4 bytes at the given address, throws invalid_byte_error
            static chunk_type from_bytes(const void* data) {
                std::array<std::uint8_t, 4> bytes;
                std::memcpy(bytes.data(), data, 4);
                return chunk_type(bytes);
            }

            /**
             * @brief Parse a type code from text
             * @param text Exactly four ASCII characters
             * @throws format_error if text is not 4 bytes of ASCII
             * @throws invalid_byte_error if a character is not a letter
             */
            static chunk_type parse(std::string_view text) {
                PNGCHUNK_THROW_FORMAT_UNLESS(text.size() == 4,
                    "Chunk type must be exactly 4 ASCII bytes, got ", text.size(), " bytes");
                PNGCHUNK_THROW_FORMAT_UNLESS(
                    std::all_of(text.begin(), text.end(), [](char c) {
                        return static_cast<unsigned char>(c) < 0x80;
                    }),
                    "Chunk type must be exactly 4 ASCII bytes, got non-ASCII text");
                return chunk_type(text[0], text[1], text[2], text[3]);
            }

            // Like parse, but returns nullopt instead of throwing
            static std::optional<chunk_type> try_parse(std::string_view text) {
                if (text.size() != 4 ||
                    !std::all_of(text.begin(), text.end(), [](char c) {
                        return is_valid_byte(static_cast<std::uint8_t>(c));
                    })) {
                    return std::nullopt;
                }
                return chunk_type(text[0], text[1], text[2], text[3]);
            }

            // Valid bytes are the ASCII letters A-Z (65-90) and a-z (97-122)
            static constexpr bool is_valid_byte(std::uint8_t byte) {
                return (byte >= 'A' && byte <= 'Z') || (byte >= 'a' && byte <= 'z');
            }

            [[nodiscard]] constexpr std::array<std::uint8_t, 4> raw_bytes() const {
                return {
                    static_cast<std::uint8_t>(m_bytes[0]),
                    static_cast<std::uint8_t>(m_bytes[1]),
                    static_cast<std::uint8_t>(m_bytes[2]),
                    static_cast<std::uint8_t>(m_bytes[3])
                };
            }

            // Convert to string (lossless, the bytes are always ASCII letters)
            [[nodiscard]] std::string to_string() const {
                return {m_bytes.data(), 4};
            }

            [[nodiscard]] std::string_view to_string_view() const {
                return {m_bytes.data(), 4};
            }

            // Write to bytes
            void to_bytes(void* dest) const {
                std::memcpy(dest, m_bytes.data(), 4);
            }

            // Property bits
            [[nodiscard]] constexpr bool is_critical() const { return is_upper(m_bytes[0]); }
            [[nodiscard]] constexpr bool is_public() const { return is_upper(m_bytes[1]); }
            [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return is_upper(m_bytes[2]); }
            [[nodiscard]] constexpr bool is_safe_to_copy() const { return !is_upper(m_bytes[3]); }

            // All bytes are letters and the reserved bit is set correctly
            [[nodiscard]] constexpr bool is_valid() const {
                return is_reserved_bit_valid() &&
                       is_valid_byte(static_cast<std::uint8_t>(m_bytes[0])) &&
                       is_valid_byte(static_cast<std::uint8_t>(m_bytes[1])) &&
                       is_valid_byte(static_cast<std::uint8_t>(m_bytes[2])) &&
                       is_valid_byte(static_cast<std::uint8_t>(m_bytes[3]));
            }

            constexpr char operator[](std::size_t i) const { return m_bytes[i]; }

            [[nodiscard]] constexpr auto begin() const { return m_bytes.begin(); }
            [[nodiscard]] constexpr auto end() const { return m_bytes.end(); }

            // Comparison operators
            bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
            bool operator!=(const chunk_type& o) const { return !(*this == o); }
            bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

            // Stream output, quoted
            friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
                os << '\'';
                os.write(t.m_bytes.data(), 4);
                os << '\'';
                return os;
            }

        private:
            static constexpr bool is_upper(char c) {
                // bit 5 clear means upper case for letters
                return (static_cast<std::uint8_t>(c) & 0x20) == 0;
            }

            static constexpr char checked(char c) {
                const auto byte = static_cast<std::uint8_t>(c);
                if (!is_valid_byte(byte)) {
                    throw invalid_byte_error(byte, build_error_msg(
                        "Invalid byte ", static_cast<unsigned>(byte),
                        " in chunk type. Valid bytes are ASCII A-Z and a-z, or 65-90 and 97-122"));
                }
                return c;
            }

            std::array<char, 4> m_bytes;
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            t.to_bytes(&v);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal, a bad literal fails to compile in constant expressions
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw format_error("Chunk type literal must be exactly 4 characters");
        }
        return {str[0], str[1], str[2], str[3]};
    }

    // Standard chunk types the library refers to
    namespace chunk_types {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type PLTE('P', 'L', 'T', 'E');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
        inline constexpr chunk_type tEXt('t', 'E', 'X', 't');
        inline constexpr chunk_type zTXt('z', 'T', 'X', 't');
        inline constexpr chunk_type iTXt('i', 'T', 'X', 't');
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}

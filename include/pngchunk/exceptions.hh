/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngchunk library
 *
 * Every failure of the library is reported as an exception derived from
 * png_error. Each exception carries an error_code from a closed set, so
 * callers may either catch by type or switch on code().
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>
#include <utility>
#include <vector>

namespace pngchunk {

    /**
     * @enum error_code
     * @brief Closed set of failure kinds
     */
    enum class error_code {
        invalid_format,   ///< Type code text is not exactly 4 ASCII bytes
        invalid_byte,     ///< Type code byte outside A-Z / a-z
        too_short,        ///< Fewer than 8 bytes where a chunk was expected
        truncated,        ///< Fewer bytes than the declared length demands
        crc_mismatch,     ///< Stored CRC differs from the computed one
        chunk_too_large,  ///< Declared chunk length exceeds the configured limit
        missing_header,   ///< Fewer than 8 bytes where the signature was expected
        bad_header,       ///< First 8 bytes are not the PNG signature
        not_found,        ///< No chunk of the requested type
        invalid_encoding  ///< Chunk data is not valid UTF-8
    };

    /**
     * @brief Stable name of an error code
     */
    inline const char* to_string(error_code code) {
        switch (code) {
            case error_code::invalid_format:
                return "invalid_format";
            case error_code::invalid_byte:
                return "invalid_byte";
            case error_code::too_short:
                return "too_short";
            case error_code::truncated:
                return "truncated";
            case error_code::crc_mismatch:
                return "crc_mismatch";
            case error_code::chunk_too_large:
                return "chunk_too_large";
            case error_code::missing_header:
                return "missing_header";
            case error_code::bad_header:
                return "bad_header";
            case error_code::not_found:
                return "not_found";
            case error_code::invalid_encoding:
                return "invalid_encoding";
        }
        // make compiler happy
        return "unknown";
    }

    /**
     * @class png_error
     * @brief Base exception class for all pngchunk errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every library error with a single catch block.
     */
    class png_error : public std::runtime_error {
    public:
        png_error(error_code code, const std::string& msg)
            : std::runtime_error(msg), m_code(code) {}

        [[nodiscard]] error_code code() const noexcept { return m_code; }

    private:
        error_code m_code;
    };

    /**
     * @class type_error
     * @brief A chunk type code could not be constructed
     */
    class type_error : public png_error {
    public:
        type_error(error_code code, const std::string& msg)
            : png_error(code, msg) {}
    };

    /**
     * @class format_error
     * @brief Type code text is not exactly 4 ASCII bytes
     */
    class format_error : public type_error {
    public:
        explicit format_error(const std::string& msg)
            : type_error(error_code::invalid_format, msg) {}
    };

    /**
     * @class invalid_byte_error
     * @brief A type code byte is outside the ranges A-Z and a-z
     */
    class invalid_byte_error : public type_error {
    public:
        invalid_byte_error(std::uint8_t byte, const std::string& msg)
            : type_error(error_code::invalid_byte, msg), m_byte(byte) {}

        /// The offending byte
        [[nodiscard]] std::uint8_t byte() const noexcept { return m_byte; }

    private:
        std::uint8_t m_byte;
    };

    /**
     * @class parse_error
     * @brief Exception for framing errors in a byte stream
     *
     * Thrown when a byte buffer is too short for the structure it
     * should contain, or when a declared length cannot be honoured.
     */
    class parse_error : public png_error {
    public:
        parse_error(error_code code, const std::string& msg)
            : png_error(code, msg) {}
    };

    /**
     * @class crc_error
     * @brief Integrity check of a chunk failed
     */
    class crc_error : public parse_error {
    public:
        crc_error(std::uint32_t expected, std::uint32_t actual, const std::string& msg)
            : parse_error(error_code::crc_mismatch, msg), m_expected(expected), m_actual(actual) {}

        /// CRC stored in the byte stream
        [[nodiscard]] std::uint32_t expected() const noexcept { return m_expected; }
        /// CRC computed over type and data
        [[nodiscard]] std::uint32_t actual() const noexcept { return m_actual; }

    private:
        std::uint32_t m_expected;
        std::uint32_t m_actual;
    };

    /**
     * @class header_error
     * @brief The byte stream does not start with the PNG signature
     */
    class header_error : public parse_error {
    public:
        header_error(error_code code, std::vector<std::uint8_t> found, const std::string& msg)
            : parse_error(code, msg), m_found(std::move(found)) {}

        /// Leading bytes that were found instead of the signature (at most 8)
        [[nodiscard]] const std::vector<std::uint8_t>& found() const noexcept { return m_found; }

    private:
        std::vector<std::uint8_t> m_found;
    };

    /**
     * @class not_found_error
     * @brief No chunk matched a remove-by-type query
     */
    class not_found_error : public png_error {
    public:
        explicit not_found_error(const std::string& msg)
            : png_error(error_code::not_found, msg) {}
    };

    /**
     * @class encoding_error
     * @brief Chunk data requested as text is not valid UTF-8
     */
    class encoding_error : public png_error {
    public:
        encoding_error(std::size_t offset, const std::string& msg)
            : png_error(error_code::invalid_encoding, msg), m_offset(offset) {}

        /// Offset of the first byte that breaks the encoding
        [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    private:
        std::size_t m_offset;
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
     * @def PNGCHUNK_THROW_PARSE
     * @brief Throw a parse_error with the given code and formatted message
     */
    #define PNGCHUNK_THROW_PARSE(code, ...) \
        throw ::pngchunk::parse_error(code, ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def PNGCHUNK_THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     */
    #define PNGCHUNK_THROW_PARSE_IF(condition, code, ...) \
        do { if (condition) PNGCHUNK_THROW_PARSE(code, __VA_ARGS__); } while(0)

    /**
     * @def PNGCHUNK_THROW_FORMAT
     * @brief Throw a format_error with formatted message
     */
    #define PNGCHUNK_THROW_FORMAT(...) \
        throw ::pngchunk::format_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def PNGCHUNK_THROW_FORMAT_UNLESS
     * @brief Throw a format_error unless condition is true
     */
    #define PNGCHUNK_THROW_FORMAT_UNLESS(condition, ...) \
        do { if (!(condition)) PNGCHUNK_THROW_FORMAT(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk

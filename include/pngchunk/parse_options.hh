/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk streams
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing PNG chunk streams
     *
     * Controls strictness, size limits, and warning handling.
     * Header, chunk type and CRC checks are never relaxed.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, parsing fails on chunks longer than max_chunk_size.
         * When false, they are reported through on_warning and parsing
         * continues.
         */
        bool strict = true;

        /**
         * @brief Fail on 1 to 3 stray bytes after the last chunk
         *
         * By default such bytes are ignored and reported as a
         * "trailing_data" warning. Independent of strict.
         */
        bool reject_trailing_data = false;

        /**
         * @brief Maximum allowed chunk data length in bytes
         *
         * Default is 2^31 - 1, the largest length PNG permits.
         */
        std::uint64_t max_chunk_size = (std::uint64_t(1) << 31) - 1;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Byte offset where the warning occurred
         * @param category Warning category (e.g., "size_limit", "missing_iend")
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

/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for chunk decoding
 * @author libpngchunk contributors
 * @date 18/10/2026
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @brief Largest chunk length allowed by the PNG specification (2^31 - 1)
     */
    inline constexpr std::uint32_t png_max_chunk_size = 0x7FFFFFFFu;

    /**
     * @struct parse_options
     * @brief Configuration options for parsing a chunk
     *
     * Controls strictness, size limits and warning handling. The defaults
     * accept every chunk whose fields are consistent.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, limit violations below are errors.
         * When false, they are reported through on_warning and parsing continues.
         * Length and CRC mismatches are always errors.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed declared payload length in bytes
         *
         * Default is the full 32-bit range. Set to png_max_chunk_size to
         * enforce the PNG limit.
         */
        std::uint32_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @brief Accept bytes following the chunk
         *
         * When false and strict, leftover input after the CRC field is an
         * error. Otherwise it is ignored and reported as a warning.
         */
        bool allow_trailing_data = true;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Input offset where the warning occurred
         * @param category Warning category ("size_limit", "trailing_data", "nonconforming_type")
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
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk

/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 * @author libpngchunk contributors
 * @date 18/10/2026
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class pngchunk_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every chunk-related error with a single catch block.
     */
    class PNGCHUNK_EXPORT pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when a field cannot be read because the input is too short,
     * or when writing a chunk to a sink fails.
     */
    class PNGCHUNK_EXPORT io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for format errors
     *
     * Thrown when the input violates the chunk layout. The subclasses below
     * carry the values involved in the failed check.
     */
    class PNGCHUNK_EXPORT parse_error : public pngchunk_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class invalid_encoding
     * @brief A chunk type candidate contains a byte outside the ASCII range
     */
    class PNGCHUNK_EXPORT invalid_encoding : public parse_error {
    public:
        invalid_encoding()
            : parse_error("Bytes have to be within the ASCII range") {}
    };

    /**
     * @class invalid_length
     * @brief A length did not match the expected one
     *
     * Raised with actual = 4 when a textual chunk type is not 4 bytes long,
     * and with actual = recomputed payload length when a parsed chunk
     * declares a different length.
     */
    class PNGCHUNK_EXPORT invalid_length : public parse_error {
    public:
        invalid_length(std::uint64_t actual, std::uint64_t found);

        [[nodiscard]] std::uint64_t actual() const noexcept { return m_actual; }
        [[nodiscard]] std::uint64_t found() const noexcept { return m_found; }

    private:
        std::uint64_t m_actual;
        std::uint64_t m_found;
    };

    /**
     * @class invalid_crc
     * @brief The checksum embedded in a chunk does not match the recomputed one
     */
    class PNGCHUNK_EXPORT invalid_crc : public parse_error {
    public:
        invalid_crc(std::uint32_t actual, std::uint32_t found);

        [[nodiscard]] std::uint32_t actual() const noexcept { return m_actual; }
        [[nodiscard]] std::uint32_t found() const noexcept { return m_found; }

    private:
        std::uint32_t m_actual;
        std::uint32_t m_found;
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
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error with formatted message
     */
    #define THROW_PARSE(...) \
        throw ::pngchunk::parse_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     */
    #define THROW_PARSE_IF(condition, ...) \
        do { if (condition) THROW_PARSE(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk

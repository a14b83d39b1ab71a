/**
 * @file chunk_type.hh
 * @brief Four byte chunk type code with PNG property bits
 * @author libpngchunk contributors
 * @date 18/10/2026
 */

#pragma once

#include <array>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>

#include <pngchunk/exceptions.hh>

namespace pngchunk {

    /**
     * @class chunk_type
     * @brief Validated 4 byte chunk type code
     *
     * Every byte is guaranteed to be in the ASCII range. The case of each
     * byte carries one property bit, following the PNG naming convention:
     *
     * | byte | uppercase        | lowercase      |
     * |------|------------------|----------------|
     * | 0    | critical         | ancillary      |
     * | 1    | public           | private        |
     * | 2    | reserved bit set | invalid        |
     * | 3    | unsafe to copy   | safe to copy   |
     *
     * Values are immutable once constructed.
     */
    class chunk_type {
    public:
        static constexpr std::size_t size = 4;

        /**
         * @brief Construct from 4 individual chars
         * @throws invalid_encoding if any char is outside the ASCII range
         */
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : m_bytes{ c0, c1, c2, c3 } {
            validate();
        }

        /**
         * @brief Construct from text
         * @throws invalid_length if the text is not exactly 4 bytes long
         * @throws invalid_encoding if any byte is outside the ASCII range
         */
        explicit chunk_type(std::string_view sv) {
            if (sv.size() != size) {
                throw invalid_length(size, sv.size());
            }
            std::copy_n(sv.begin(), size, m_bytes.begin());
            validate();
        }

        /**
         * @brief Construct from a C string
         * @throws invalid_length if str is null or not exactly 4 bytes long
         */
        explicit chunk_type(const char* str) : chunk_type(str ? std::string_view(str) : std::string_view()) {}

        explicit chunk_type(const std::string& str) : chunk_type(std::string_view(str)) {}

        /**
         * @brief Construct from a 4 byte array
         * @throws invalid_encoding if any byte is outside the ASCII range
         */
        static chunk_type from_bytes(const std::array<std::uint8_t, 4>& bytes) {
            return from_bytes(bytes.data());
        }

        /**
         * @brief Construct from 4 bytes of raw memory
         * @throws invalid_encoding if any byte is outside the ASCII range
         */
        static chunk_type from_bytes(const void* data) {
            const auto* p = static_cast<const char*>(data);
            return {p[0], p[1], p[2], p[3]};
        }

        /**
         * @brief Same as the text constructor, named for symmetry with from_bytes
         */
        static chunk_type from_string(std::string_view sv) {
            return chunk_type(sv);
        }

        [[nodiscard]] std::array<std::uint8_t, 4> bytes() const {
            std::array<std::uint8_t, 4> result{};
            std::memcpy(result.data(), m_bytes.data(), size);
            return result;
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), size);
        }

        [[nodiscard]] std::string to_string() const {
            return {m_bytes.data(), size};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {m_bytes.data(), size};
        }

        // Read-only access to individual characters
        constexpr char operator[](std::size_t i) const { return m_bytes[i]; }

        [[nodiscard]] constexpr auto begin() const { return m_bytes.begin(); }
        [[nodiscard]] constexpr auto end() const { return m_bytes.end(); }

        /// Byte 0 is uppercase
        [[nodiscard]] constexpr bool is_critical() const { return is_upper(m_bytes[0]); }

        /// Byte 1 is uppercase
        [[nodiscard]] constexpr bool is_public() const { return is_upper(m_bytes[1]); }

        /// Byte 2 is uppercase
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return is_upper(m_bytes[2]); }

        /// Byte 3 is lowercase
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return is_lower(m_bytes[3]); }

        /**
         * @brief Check conformance with the PNG chunk naming rules
         * @return True if all bytes are ASCII letters and the reserved bit is valid
         */
        [[nodiscard]] bool is_valid() const {
            return is_reserved_bit_valid() &&
                   std::all_of(m_bytes.begin(), m_bytes.end(), [](char c) {
                       return is_upper(c) || is_lower(c);
                   });
        }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }
        bool operator<=(const chunk_type& o) const { return m_bytes <= o.m_bytes; }
        bool operator>(const chunk_type& o) const { return m_bytes > o.m_bytes; }
        bool operator>=(const chunk_type& o) const { return m_bytes >= o.m_bytes; }

        // Stream output
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            if (os.flags() & std::ios::hex) {
                // Big-endian numeric value, as the type appears on the wire
                auto flags = os.flags();
                auto fill = os.fill();
                os << "0x" << std::setfill('0');
                for (char c : t.m_bytes) {
                    os << std::setw(2) << static_cast<unsigned>(static_cast<unsigned char>(c));
                }
                os.flags(flags);
                os.fill(fill);
            } else {
                os << '\'';
                for (char c : t.m_bytes) {
                    if (c >= 32 && c <= 126) {
                        os << c;
                    } else {
                        // Escape non-printable characters
                        auto flags = os.flags();
                        auto fill = os.fill();
                        os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                           << static_cast<unsigned>(static_cast<unsigned char>(c));
                        os.flags(flags);
                        os.fill(fill);
                    }
                }
                os << '\'';
            }
            return os;
        }

    private:
        static constexpr bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
        static constexpr bool is_lower(char c) { return c >= 'a' && c <= 'z'; }

        constexpr void validate() const {
            for (char c : m_bytes) {
                if (static_cast<unsigned char>(c) > 0x7F) {
                    throw invalid_encoding();
                }
            }
        }

        std::array<char, 4> m_bytes{};
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            t.to_bytes(&v);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    /**
     * @brief User-defined literal for compile-time chunk types
     *
     * "IHDR"_ct is a constant expression; a literal that is not 4 ASCII
     * characters fails to compile when used in a constant context and throws
     * otherwise.
     */
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != chunk_type::size) {
            throw invalid_length(chunk_type::size, len);
        }
        return {str[0], str[1], str[2], str[3]};
    }

    /**
     * @brief Well-known chunk types from the PNG specification
     */
    namespace chunk_types {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type PLTE('P', 'L', 'T', 'E');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
        inline constexpr chunk_type tEXt('t', 'E', 'X', 't');
        inline constexpr chunk_type zTXt('z', 'T', 'X', 't');
        inline constexpr chunk_type iTXt('i', 'T', 'X', 't');
        inline constexpr chunk_type gAMA('g', 'A', 'M', 'A');
        inline constexpr chunk_type sRGB('s', 'R', 'G', 'B');
        inline constexpr chunk_type pHYs('p', 'H', 'Y', 's');
        inline constexpr chunk_type tIME('t', 'I', 'M', 'E');
    }

} // namespace pngchunk

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}

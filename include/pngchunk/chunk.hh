/**
 * @file chunk.hh
 * @brief Length-prefixed, typed and checksummed PNG chunk
 * @author libpngchunk contributors
 * @date 18/10/2026
 */

#pragma once

#include <iosfwd>
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @struct raw_chunk
     * @brief Chunk fields exactly as read from the wire, not yet verified
     */
    struct raw_chunk {
        std::uint32_t length;           ///< Declared payload length
        chunk_type type;                ///< Chunk type code
        std::vector<std::byte> data;    ///< Payload
        std::uint32_t crc;              ///< Declared CRC-32
    };

    /**
     * @class chunk
     * @brief A single chunk: [length:4][type:4][data:length][crc:4]
     *
     * Integers are big-endian. The CRC is CRC-32 (ISO-HDLC, as used by
     * zlib and IEEE 802.3) over the type bytes followed by the payload.
     *
     * Every chunk object satisfies length() == data().size() and
     * crc() == crc32(type(), data()), whether it was built from a payload
     * or parsed from bytes. Chunks are immutable values.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Size of length, type and crc fields together
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Build a chunk from a type and a payload
         * @param type Chunk type
         * @param data Payload, ownership is taken
         * @throws invalid_length if the payload does not fit a 32-bit length
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Parse a chunk from the beginning of a byte buffer
         * @param data Input buffer
         * @param size Number of bytes available
         * @param options Limits and warning callback
         * @return The verified chunk
         * @throws io_error if the buffer ends before a field is complete
         * @throws invalid_encoding if the type contains a non-ASCII byte
         * @throws invalid_length if the declared length does not match the payload
         * @throws invalid_crc if the declared CRC does not match the recomputed one
         * @throws parse_error if a strict parse_options limit is violated
         *
         * Bytes after the CRC field are not consumed; serialized_size() tells
         * how many were.
         */
        static chunk parse(const void* data, std::size_t size, const parse_options& options);

        static chunk parse(const void* data, std::size_t size);

        static chunk parse(const std::vector<std::byte>& bytes, const parse_options& options);

        static chunk parse(const std::vector<std::byte>& bytes);

        /**
         * @brief Verify wire fields against the values derived from type and payload
         * @param raw Declared fields
         * @return The verified chunk
         * @throws invalid_length if raw.length != raw.data.size()
         * @throws invalid_crc if raw.crc does not match the payload checksum
         */
        static chunk validate(raw_chunk raw);

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /**
         * @brief Size of the serialized form
         * @return overhead + length(), computed in 64 bits
         */
        [[nodiscard]] std::uint64_t serialized_size() const { return overhead + static_cast<std::uint64_t>(m_length); }

        /**
         * @brief Serialize to the canonical byte layout
         */
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        /**
         * @brief Write the serialized chunk to a stream
         * @throws io_error if the stream fails
         */
        void write(std::ostream& os) const;

        /**
         * @brief Payload as text
         *
         * Returns the payload if it is valid UTF-8, otherwise one U+FFFD
         * replacement character per payload byte. For display only.
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    /**
     * @brief CRC-32 over a chunk type followed by a payload
     * @param type Chunk type, hashed first
     * @param data Payload
     * @param size Payload size in bytes
     * @return CRC-32/ISO-HDLC checksum
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const chunk_type& type, const std::byte* data, std::size_t size);

    /**
     * @brief Convenience overload over a payload vector
     */
    inline std::uint32_t crc32(const chunk_type& type, const std::vector<std::byte>& data) {
        return crc32(type, data.data(), data.size());
    }

} // namespace pngchunk

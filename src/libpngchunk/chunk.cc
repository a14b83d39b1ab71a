//
// Created on 18/10/2026.
//

#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/byte_order.hh>
#include "input.hh"
#include "utf8.hh"

#include <algorithm>
#include <cstring>
#include <limits>
#include <ostream>

#include <zlib.h>

namespace pngchunk {

    namespace {
        std::uint32_t checked_length(std::size_t size) {
            if (static_cast<std::uint64_t>(size) > std::numeric_limits<std::uint32_t>::max()) {
                throw invalid_length(size, static_cast<std::uint32_t>(size));
            }
            return static_cast<std::uint32_t>(size);
        }

        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }
    }

    std::uint32_t crc32(const chunk_type& type, const std::byte* data, std::size_t size) {
        uLong crc = ::crc32(0L, Z_NULL, 0);

        auto tag = type.bytes();
        crc = ::crc32(crc, tag.data(), static_cast<uInt>(tag.size()));

        // zlib takes uInt lengths, feed larger payloads in pieces
        while (size > 0) {
            auto n = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), n);
            data += n;
            size -= n;
        }
        return static_cast<std::uint32_t>(crc);
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(checked_length(data.size()))
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(crc32(m_type, m_data)) {
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length)
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::validate(raw_chunk raw) {
        chunk derived(raw.type, std::move(raw.data));

        if (derived.length() != raw.length) {
            throw invalid_length(derived.length(), raw.length);
        }
        if (derived.crc() != raw.crc) {
            throw invalid_crc(derived.crc(), raw.crc);
        }

        return {raw.length, raw.type, std::move(derived.m_data), raw.crc};
    }

    chunk chunk::parse(const void* data, std::size_t size, const parse_options& options) {
        memory_reader reader(data, size);

        auto length = reader.read<std::uint32_t>(byte_order::big);
        if (length > options.max_chunk_size) {
            auto msg = build_error_msg("Chunk length ", length,
                                       " exceeds maximum allowed size of ", options.max_chunk_size, " bytes");
            THROW_PARSE_IF(options.strict, msg);
            warn(options, 0, "size_limit", msg);
        }

        auto type = reader.read_chunk_type();
        if (!type.is_valid()) {
            warn(options, 4, "nonconforming_type",
                 build_error_msg("Chunk type ", type, " does not follow PNG naming rules"));
        }

        auto payload = reader.read_exact(length);
        auto crc = reader.read<std::uint32_t>(byte_order::big);

        auto result = validate(raw_chunk{length, type, std::move(payload), crc});

        if (!options.allow_trailing_data && reader.remaining() > 0) {
            auto msg = build_error_msg(reader.remaining(), " bytes after chunk ", type,
                                       " at offset ", reader.tell());
            THROW_PARSE_IF(options.strict, msg);
            warn(options, reader.tell(), "trailing_data", msg);
        }

        return result;
    }

    chunk chunk::parse(const void* data, std::size_t size) {
        return parse(data, size, parse_options{});
    }

    chunk chunk::parse(const std::vector<std::byte>& bytes, const parse_options& options) {
        return parse(bytes.data(), bytes.size(), options);
    }

    chunk chunk::parse(const std::vector<std::byte>& bytes) {
        return parse(bytes.data(), bytes.size(), parse_options{});
    }

    std::vector<std::byte> chunk::to_bytes() const {
        std::vector<std::byte> out(static_cast<std::size_t>(serialized_size()));

        store(m_length, out.data(), byte_order::big);
        m_type.to_bytes(out.data() + 4);
        std::copy(m_data.begin(), m_data.end(), out.begin() + 8);
        store(m_crc, out.data() + 8 + m_length, byte_order::big);

        return out;
    }

    void chunk::write(std::ostream& os) const {
        auto bytes = to_bytes();
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_IF(!os, "Failed to write chunk ", m_type, " (", bytes.size(), " bytes)");
    }

    std::string chunk::to_string() const {
        if (is_valid_utf8(m_data.data(), m_data.size())) {
            return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
        }

        std::string result;
        result.reserve(m_length * (sizeof(replacement_character) - 1));
        for (std::uint32_t i = 0; i < m_length; i++) {
            result += replacement_character;
        }
        return result;
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type &&
               m_data == o.m_data && m_crc == o.m_crc;
    }

} // namespace pngchunk

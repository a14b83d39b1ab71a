//
// Created on 18/10/2026.
//

#include <algorithm>

#include "input.hh"

namespace pngchunk {
    // reader_base implementation
    chunk_type reader_base::read_chunk_type() {
        std::array<char, chunk_type::size> data;
        std::size_t actual = read(data.data(), data.size());
        THROW_IO_IF(actual != data.size(), "Failed to read chunk type, got ", actual, " of 4 bytes");
        return chunk_type::from_bytes(data.data());
    }

    // memory_reader implementation
    memory_reader::memory_reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)), m_size(size), m_position(0) {
        THROW_IO_IF(!m_data && m_size > 0, "Null buffer with non-zero size ", m_size);
    }

    std::size_t memory_reader::read(void* dst, std::size_t size) {
        THROW_IO_IF(!dst && size > 0, "Null buffer in read");

        std::size_t to_read = std::min(size, m_size - m_position);
        if (to_read == 0) {
            return 0;  // EOF-like behavior
        }

        std::memcpy(dst, m_data + m_position, to_read);
        m_position += to_read;
        return to_read;
    }

    std::uint64_t memory_reader::tell() const {
        return m_position;
    }

    std::uint64_t memory_reader::size() const {
        return m_size;
    }
}

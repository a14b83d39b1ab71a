//
// Created on 18/10/2026.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>

#include <pngchunk/exceptions.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    // Base reader interface
    class reader_base {
        public:
            virtual ~reader_base() = default;

            // Simple interface - throws on error, returns less than size at end of input
            virtual std::size_t read(void* dst, std::size_t size) = 0;
            virtual std::uint64_t tell() const = 0;
            virtual std::uint64_t size() const = 0;

            std::uint64_t remaining() const {
                return size() - tell();
            }

            // Convenience methods
            std::vector<std::byte> read_exact(std::size_t size) {
                THROW_IO_IF(size > remaining(), "Unexpected end of input at offset ", tell(),
                            ": requested ", size, " bytes, ", remaining(), " available");
                std::vector<std::byte> buffer(size);
                std::size_t actual = read(buffer.data(), size);
                THROW_IO_IF(actual != size, "Unexpected end of input: requested ", size, " got ", actual);
                return buffer;
            }

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_IO_IF(actual != sizeof(T), "Failed to read ", sizeof(T), " bytes, got ", actual);

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            chunk_type read_chunk_type();
    };

    // Reads from a caller-owned byte range
    class memory_reader : public reader_base {
        public:
            memory_reader(const void* data, std::size_t size);
            ~memory_reader() override = default;

            memory_reader(const memory_reader&) = delete;
            memory_reader& operator = (const memory_reader&) = delete;

            using reader_base::read;
            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t tell() const override;
            std::uint64_t size() const override;

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}

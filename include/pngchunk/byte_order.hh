/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities for chunk fields
 * @author libpngchunk contributors
 * @date 18/10/2026
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <pngchunk/endian.hh>

namespace pngchunk {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) for reading/writing multi-byte values
     */
    enum class byte_order {
        little, ///< Little-endian
        big     ///< Big-endian (network order, used for every PNG integer)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     */
    constexpr bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }

    /**
     * @brief Store a value into raw memory using the given byte order
     * @tparam T Integral type to store
     * @param value Value to store
     * @param dest Destination, at least sizeof(T) bytes
     * @param bo Byte order of the destination
     */
    template<typename T>
    void store(T value, void* dest, byte_order bo) {
        if constexpr (sizeof(T) > 1) {
            if (!byte_order_native(bo)) {
                value = swap_byte_order(value);
            }
        }
        std::memcpy(dest, &value, sizeof(T));
    }
}

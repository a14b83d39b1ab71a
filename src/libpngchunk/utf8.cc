//
// Created on 18/10/2026.
//

#include "utf8.hh"

#include <cstdint>

namespace pngchunk {

    bool is_valid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto c = std::to_integer<std::uint8_t>(data[i]);

            if (c < 0x80) {
                i++;
                continue;
            }

            std::size_t extra;
            std::uint8_t lo = 0x80;
            std::uint8_t hi = 0xBF;

            if (c >= 0xC2 && c <= 0xDF) {
                extra = 1;
            } else if (c == 0xE0) {
                extra = 2;
                lo = 0xA0;  // overlong
            } else if (c == 0xED) {
                extra = 2;
                hi = 0x9F;  // surrogates
            } else if (c >= 0xE1 && c <= 0xEF) {
                extra = 2;
            } else if (c == 0xF0) {
                extra = 3;
                lo = 0x90;  // overlong
            } else if (c >= 0xF1 && c <= 0xF3) {
                extra = 3;
            } else if (c == 0xF4) {
                extra = 3;
                hi = 0x8F;  // above U+10FFFF
            } else {
                return false;
            }

            if (size - i <= extra) {
                return false;
            }

            // Only the first continuation byte has a narrowed range
            auto c1 = std::to_integer<std::uint8_t>(data[i + 1]);
            if (c1 < lo || c1 > hi) {
                return false;
            }
            for (std::size_t k = 2; k <= extra; k++) {
                auto ck = std::to_integer<std::uint8_t>(data[i + k]);
                if (ck < 0x80 || ck > 0xBF) {
                    return false;
                }
            }

            i += extra + 1;
        }
        return true;
    }

} // namespace pngchunk

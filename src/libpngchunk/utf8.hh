//
// Created on 18/10/2026.
//

#pragma once

#include <cstddef>

namespace pngchunk {

    // True if [data, data + size) is well-formed UTF-8 (RFC 3629): no overlong
    // forms, no surrogates, nothing above U+10FFFF.
    bool is_valid_utf8(const std::byte* data, std::size_t size);

    // UTF-8 encoding of U+FFFD
    inline constexpr char replacement_character[] = "\xEF\xBF\xBD";

} // namespace pngchunk

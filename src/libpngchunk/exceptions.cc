//
// Created on 18/10/2026.
//

#include <pngchunk/exceptions.hh>

namespace pngchunk {

    invalid_length::invalid_length(std::uint64_t actual, std::uint64_t found)
        : parse_error(build_error_msg("Expected length ", actual, ", got length ", found))
        , m_actual(actual)
        , m_found(found) {
    }

    invalid_crc::invalid_crc(std::uint32_t actual, std::uint32_t found)
        : parse_error(build_error_msg("Expected crc ", actual, ", got crc ", found))
        , m_actual(actual)
        , m_found(found) {
    }

} // namespace pngchunk

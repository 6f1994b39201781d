//
// Fixed layout constants of the container.
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace pngchunk {

    // 89 'P' 'N' 'G' CR LF SUB LF
    inline constexpr std::array<std::byte, 8> file_signature = {
        std::byte{0x89}, std::byte{0x50}, std::byte{0x4E}, std::byte{0x47},
        std::byte{0x0D}, std::byte{0x0A}, std::byte{0x1A}, std::byte{0x0A}
    };

    inline constexpr std::size_t signature_size = file_signature.size();

    // length (4) + type (4)
    inline constexpr std::size_t chunk_header_size = 8;
    inline constexpr std::size_t chunk_crc_size = 4;
    inline constexpr std::size_t chunk_framing_size = chunk_header_size + chunk_crc_size;

    // Largest payload a length field may declare (2^31 - 1)
    inline constexpr std::uint32_t max_chunk_length = 0x7FFFFFFFu;

} // namespace pngchunk

/**
 * @file crc32.hh
 * @brief CRC-32 used for per chunk integrity checks
 *
 * Standard reflected CRC-32: polynomial 0xEDB88320, initial value
 * 0xFFFFFFFF, final complement. Output matches the checksums stored in
 * PNG files.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <span>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    /// Register value before any byte has been fed
    inline constexpr std::uint32_t crc32_initial = 0xFFFFFFFFu;

    /**
     * @brief Feed bytes into a running CRC register
     * @param state Register value from crc32_initial or a previous update
     * @param bytes Data to append
     * @return New register value (not yet complemented)
     */
    PNGCHUNK_EXPORT std::uint32_t crc32_update(std::uint32_t state, std::span<const std::byte> bytes);

    /// Final complement of the register
    inline std::uint32_t crc32_finish(std::uint32_t state) {
        return state ^ 0xFFFFFFFFu;
    }

    /**
     * @brief CRC-32 of a byte sequence
     *
     * Pure function, defined for empty input (returns 0).
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(std::span<const std::byte> bytes);

    /**
     * @brief Checksum of a chunk: CRC-32 over type ++ payload
     *
     * Computed incrementally, the two parts are never concatenated.
     */
    PNGCHUNK_EXPORT std::uint32_t chunk_crc(const chunk_type& type, std::span<const std::byte> payload);

} // namespace pngchunk

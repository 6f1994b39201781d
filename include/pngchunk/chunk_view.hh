/**
 * @file chunk_view.hh
 * @brief Borrowed description of one chunk inside a source buffer
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/format.hh>

namespace pngchunk {

    /**
     * @struct chunk_view
     * @brief One chunk as it exists in a source buffer
     *
     * The payload is a span into the buffer the reader scanned; nothing is
     * copied. A view is valid only while that buffer is alive and unmodified.
     * The library cannot check this: keeping the buffer alive and untouched
     * is the caller's precondition.
     */
    struct PNGCHUNK_EXPORT chunk_view {
        chunk_type type;                        ///< Chunk type tag
        std::span<const std::byte> payload;     ///< Borrowed payload bytes
        std::uint32_t stored_crc = 0;           ///< CRC-32 as stored in the file
        std::size_t offset = 0;                 ///< Offset of the length field in the source
        std::size_t index = 0;                  ///< Ordinal in the chunk sequence

        chunk_view() = default;

        [[nodiscard]] std::size_t length() const { return payload.size(); }

        /// Length field + type + payload + CRC
        [[nodiscard]] std::size_t total_size() const { return chunk_framing_size + payload.size(); }

        /// CRC-32 over type ++ payload
        [[nodiscard]] std::uint32_t compute_crc() const;

        /// True when the stored CRC matches the computed one
        [[nodiscard]] bool verify_crc() const;

        [[nodiscard]] bool is_header() const { return type == header_chunk_type; }
        [[nodiscard]] bool is_terminator() const { return type == terminator_chunk_type; }
    };

} // namespace pngchunk

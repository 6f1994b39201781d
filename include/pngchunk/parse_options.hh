/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for the chunk reader
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>
#include <cstddef>

#include <pngchunk/format.hh>

namespace pngchunk {

    /**
     * @typedef warning_handler
     * @brief Callback function type for handling warnings
     * @param offset Byte offset (reader) or logical index (builder) the warning refers to
     * @param category Warning category ("checksum", "trailing_data", "structure")
     * @param message Human-readable warning message
     */
    using warning_handler = std::function<void(
        std::uint64_t offset,
        std::string_view category,
        std::string_view message
    )>;

    /**
     * @struct parse_options
     * @brief Configuration options for scanning a source buffer
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a checksum mismatch or bytes after the terminator throw.
         * When false, both are reported through on_warning and the scan
         * continues. Framing and ordering errors always throw.
         */
        bool strict = true;

        /**
         * @brief Verify each chunk's CRC while scanning
         *
         * When false no checksum is computed during the scan;
         * chunk_view::verify_crc() can still be called on demand.
         */
        bool verify_checksums = true;

        /**
         * @brief Maximum allowed payload length in bytes
         *
         * Values above max_chunk_length are treated as max_chunk_length.
         */
        std::uint32_t max_chunk_size = max_chunk_length;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk

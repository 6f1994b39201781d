/**
 * @file reader.hh
 * @brief Zero-copy, single pass chunk scanner
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/chunk_view.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class reader
     * @brief Scans a source buffer front to back and yields chunk views
     *
     * The constructor only checks the file signature. Each call to next()
     * carves out one chunk, validating its framing, type tag, length and
     * checksum, and the ordering rules (header first, empty terminator last,
     * nothing after it). The reader holds a cursor into the buffer and never
     * copies payload bytes.
     *
     * The scan is single pass: once a chunk has been returned the reader does
     * not rewind. Construct a new reader over the same buffer to start again,
     * or use collect_all() to get a collection that can be walked repeatedly.
     *
     * Precondition: the source buffer outlives the reader and every
     * chunk_view it produced, and is not modified meanwhile.
     */
    class PNGCHUNK_EXPORT reader {
    public:
        /**
         * @brief Open a source buffer with default options
         * @throws signature_error if the buffer does not start with the signature
         */
        explicit reader(std::span<const std::byte> source);

        /**
         * @brief Open a source buffer with custom options
         * @throws signature_error if the buffer does not start with the signature
         */
        reader(std::span<const std::byte> source, const parse_options& options);

        /**
         * @brief Whether next() has something to produce
         *
         * True until the terminator has been returned. If bytes follow the
         * terminator (strict mode) it stays true for one more call, which
         * throws trailing_data_error. After any error it is false.
         */
        [[nodiscard]] bool has_next() const { return m_state != state::ended; }

        /**
         * @brief Produce the next chunk
         * @throws format_error subclasses on malformed input
         * @throws pngchunk_error when called after the scan has ended
         */
        chunk_view next();

        /**
         * @brief Drain the remaining scan into a vector
         *
         * The vector holds views into the same source buffer.
         * @throws the first format_error encountered
         */
        std::vector<chunk_view> collect_all();

        /// Cursor position in the source buffer
        [[nodiscard]] std::size_t position() const { return m_position; }

        /// Number of chunks produced so far
        [[nodiscard]] std::size_t chunks_read() const { return m_index; }

        [[nodiscard]] std::span<const std::byte> source() const { return m_source; }

        [[nodiscard]] const parse_options& options() const { return m_options; }

    private:
        enum class state {
            scanning,   // more chunks expected
            trailing,   // terminator seen, trailing bytes still to report
            ended
        };

        chunk_view read_chunk();
        void finish_after_terminator();
        void warn(std::uint64_t offset, std::string_view category, std::string_view message) const;

        std::span<const std::byte> m_source;
        parse_options m_options;
        std::size_t m_position;
        std::size_t m_index = 0;
        state m_state = state::scanning;
    };

    /// True when the buffer starts with the file signature
    PNGCHUNK_EXPORT bool has_signature(std::span<const std::byte> source);

    /**
     * @brief Run a full scan and return the number of chunks
     * @throws format_error subclasses on malformed input
     */
    PNGCHUNK_EXPORT std::size_t validate(std::span<const std::byte> source,
                                         const parse_options& options = {});

    /// First chunk of the given type, scanning only as far as needed
    PNGCHUNK_EXPORT std::optional<chunk_view> find_first(std::span<const std::byte> source,
                                                         const chunk_type& type,
                                                         const parse_options& options = {});

    /// Every chunk of the given type, in file order
    PNGCHUNK_EXPORT std::vector<chunk_view> find_all(std::span<const std::byte> source,
                                                     const chunk_type& type,
                                                     const parse_options& options = {});

} // namespace pngchunk

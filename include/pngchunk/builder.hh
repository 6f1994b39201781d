/**
 * @file builder.hh
 * @brief Lazy-copy construction of a chunk container
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/chunk_view.hh>
#include <pngchunk/edit_log.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    class reader;

    /**
     * @struct builder_options
     * @brief Configuration options for the builder
     */
    struct builder_options {
        /**
         * @brief Check the output structure before serializing
         *
         * When true, finalize() refuses to produce a file whose first chunk is
         * not the header chunk (missing_header_error), whose last chunk is not
         * an empty terminator (missing_terminator_error) or that has chunks
         * after a terminator (trailing_data_error). Nothing is emitted on error.
         *
         * When false, the caller is responsible for the structure; the same
         * problems are reported through on_warning (category "structure",
         * offset = logical index) and the bytes are produced anyway.
         */
        bool validate_structure = true;

        /// Optional warning handler, see parse_options::on_warning
        warning_handler on_warning;
    };

    /// Copy text into an owned payload
    PNGCHUNK_EXPORT std::vector<std::byte> to_payload(std::string_view text);

    /// Copy bytes into an owned payload
    PNGCHUNK_EXPORT std::vector<std::byte> to_payload(std::span<const std::byte> bytes);

    /**
     * @class builder
     * @brief Insert, remove, replace and reorder chunks, then serialize once
     *
     * Chunks taken from a reader are kept as borrowed views into their source
     * buffer; their bytes are copied exactly once, by finalize(). New chunks
     * own their payload from the moment they are added.
     *
     * Index arguments are logical indices over the live chunks. They shift
     * immediately: after remove(1) the chunk formerly at 2 is at 1 for the
     * next call. Entry ids returned by the adding calls are stable, see
     * index_of().
     *
     * A failed call leaves the builder unchanged.
     *
     * Precondition: every source buffer a borrowed chunk points into stays
     * alive and unmodified until the last finalize(). Several builders may
     * borrow from the same buffer.
     */
    class PNGCHUNK_EXPORT builder {
    public:
        builder();
        explicit builder(const builder_options& options);

        /// One borrowed entry per chunk, in order
        static builder from_chunks(std::span<const chunk_view> chunks,
                                   const builder_options& options = {});

        /**
         * @brief Drain a reader and seed the log with its chunks
         * @throws format_error subclasses raised by the reader
         */
        static builder from_reader(reader& r, const builder_options& options = {});

        /**
         * @brief Add an owned chunk before logical index @p index
         * @throws index_out_of_range_error if index >= size()
         * @throws invalid_type_tag_error if type is not 4 ASCII letters
         * @throws chunk_too_large_error if payload exceeds the maximum length
         */
        entry_id insert_before(std::size_t index, const chunk_type& type, std::vector<std::byte> payload);

        /// Same as insert_before, placing the chunk after @p index
        entry_id insert_after(std::size_t index, const chunk_type& type, std::vector<std::byte> payload);

        /// Add an owned chunk at the end
        entry_id append(const chunk_type& type, std::vector<std::byte> payload);

        /// Add a borrowed chunk at the end, the view may come from any source buffer
        entry_id append_chunk(const chunk_view& chunk);

        /// Add a borrowed chunk before logical index @p index
        entry_id insert_chunk_before(std::size_t index, const chunk_view& chunk);

        /**
         * @brief Remove the chunk at logical index @p index
         *
         * Later chunks move down by one logical position.
         * @throws index_out_of_range_error
         */
        void remove(std::size_t index);

        /**
         * @brief Overwrite the chunk at @p index with an owned chunk
         *
         * The slot keeps its entry id.
         */
        void replace(std::size_t index, const chunk_type& type, std::vector<std::byte> payload);

        /**
         * @brief Reorder the live chunks
         *
         * new_order[k] is the current logical index that ends up at position k.
         * @throws invalid_permutation_error unless new_order is a permutation of [0, size())
         */
        void reorder(const std::vector<std::size_t>& new_order);

        /**
         * @brief Serialize the signature and all live chunks
         *
         * Every chunk's CRC is computed afresh over its type and payload.
         * Each call performs its own pass; the result is not cached.
         * @throws empty_output_error if there is no live chunk
         * @throws missing_header_error, missing_terminator_error, trailing_data_error
         *         when validate_structure is on
         */
        [[nodiscard]] std::vector<std::byte> finalize() const;

        /// Number of live chunks
        [[nodiscard]] std::size_t size() const { return m_log.live_count(); }
        [[nodiscard]] bool empty() const { return size() == 0; }

        [[nodiscard]] chunk_type type_at(std::size_t index) const;
        [[nodiscard]] std::span<const std::byte> payload_at(std::size_t index) const;
        [[nodiscard]] bool is_borrowed(std::size_t index) const;

        /// Current logical index of an entry, empty if it was removed
        [[nodiscard]] std::optional<std::size_t> index_of(entry_id id) const;

        [[nodiscard]] const edit_log& log() const { return m_log; }
        [[nodiscard]] const builder_options& options() const { return m_options; }

    private:
        void check_index(std::size_t index, const char* operation) const;
        void check_structure() const;
        void warn(std::uint64_t index, std::string_view message) const;

        edit_log m_log;
        builder_options m_options;
    };

} // namespace pngchunk
